// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_DRIFT_DRIFTEVENTS_HPP
#define ANCHORX_DRIFT_DRIFTEVENTS_HPP

#include "borsh.hpp"
#include "events.hpp"

#include <json/json.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

/* Event types of the Drift v2 program, with the field layouts from its
   IDL (version 2.30).  Public keys are stored as raw 32-byte strings.  */

namespace anchorx
{
namespace drift
{

enum class OrderAction : uint8_t
{
  PLACE,
  CANCEL,
  FILL,
  TRIGGER,
  EXPIRE,
};

enum class OrderActionExplanation : uint8_t
{
  NONE,
  INSUFFICIENT_FREE_COLLATERAL,
  ORACLE_PRICE_BREACHED_LIMIT_PRICE,
  MARKET_ORDER_FILLED_TO_LIMIT_PRICE,
  ORDER_EXPIRED,
  CANCELED_FOR_LIQUIDATION,
  ORDER_FILLED_WITH_AMM,
  ORDER_FILLED_WITH_AMM_JIT,
  ORDER_FILLED_WITH_MATCH,
  ORDER_FILLED_WITH_MATCH_JIT,
  MARKET_EXPIRED,
  RISKING_INCREASING_ORDER,
  REDUCE_ONLY_ORDER_INCREASED_POSITION,
  ORDER_FILL_WITH_SERUM,
  NO_BORROW_LIQUIDITY,
  ORDER_FILL_WITH_PHOENIX,
  ORDER_FILLED_WITH_AMM_JIT_LP_SPLIT,
  ORDER_FILLED_WITH_LP_JIT,
  DERISK_LP,
};

enum class MarketType : uint8_t
{
  SPOT,
  PERP,
};

enum class PositionDirection : uint8_t
{
  LONG,
  SHORT,
};

enum class OrderStatus : uint8_t
{
  INIT,
  OPEN,
  FILLED,
  CANCELED,
};

enum class OrderType : uint8_t
{
  MARKET,
  LIMIT,
  TRIGGER_MARKET,
  TRIGGER_LIMIT,
  ORACLE,
};

enum class OrderTriggerCondition : uint8_t
{
  ABOVE,
  BELOW,
  TRIGGERED_ABOVE,
  TRIGGERED_BELOW,
};

/**
 * Record emitted by Drift for every action (place, cancel, fill, ...)
 * taken on an order.
 */
class OrderActionRecord : public Event
{

public:

  /** The kind name, which is also the IDL event name.  */
  static const char* const KIND;

  int64_t ts = 0;
  OrderAction action = OrderAction::PLACE;
  OrderActionExplanation actionExplanation = OrderActionExplanation::NONE;
  uint16_t marketIndex = 0;
  MarketType marketType = MarketType::SPOT;

  std::optional<std::string> filler;
  std::optional<uint64_t> fillerReward;
  std::optional<uint64_t> fillRecordId;
  std::optional<uint64_t> baseAssetAmountFilled;
  std::optional<uint64_t> quoteAssetAmountFilled;
  std::optional<uint64_t> takerFee;
  std::optional<int64_t> makerFee;
  std::optional<uint32_t> referrerReward;
  std::optional<int64_t> quoteAssetAmountSurplus;
  std::optional<uint64_t> spotFulfillmentMethodFee;

  std::optional<std::string> taker;
  std::optional<uint32_t> takerOrderId;
  std::optional<PositionDirection> takerOrderDirection;
  std::optional<uint64_t> takerOrderBaseAssetAmount;
  std::optional<uint64_t> takerOrderCumulativeBaseAssetAmountFilled;
  std::optional<uint64_t> takerOrderCumulativeQuoteAssetAmountFilled;

  std::optional<std::string> maker;
  std::optional<uint32_t> makerOrderId;
  std::optional<PositionDirection> makerOrderDirection;
  std::optional<uint64_t> makerOrderBaseAssetAmount;
  std::optional<uint64_t> makerOrderCumulativeBaseAssetAmountFilled;
  std::optional<uint64_t> makerOrderCumulativeQuoteAssetAmountFilled;

  int64_t oraclePrice = 0;

  OrderActionRecord () = default;

  std::string GetKind () const override;
  Json::Value ToJson () const override;
  std::string Encode () const override;

  static std::unique_ptr<Event> Decode (BorshReader& in);

};

/**
 * A user's order as embedded into OrderRecord.
 */
struct Order
{

  uint64_t slot = 0;
  uint64_t price = 0;
  uint64_t baseAssetAmount = 0;
  uint64_t baseAssetAmountFilled = 0;
  uint64_t quoteAssetAmountFilled = 0;
  uint64_t triggerPrice = 0;
  int64_t auctionStartPrice = 0;
  int64_t auctionEndPrice = 0;
  int64_t maxTs = 0;
  int32_t oraclePriceOffset = 0;
  uint32_t orderId = 0;
  uint16_t marketIndex = 0;
  OrderStatus status = OrderStatus::INIT;
  OrderType orderType = OrderType::MARKET;
  MarketType marketType = MarketType::SPOT;
  uint8_t userOrderId = 0;
  PositionDirection existingPositionDirection = PositionDirection::LONG;
  PositionDirection direction = PositionDirection::LONG;
  bool reduceOnly = false;
  bool postOnly = false;
  bool immediateOrCancel = false;
  OrderTriggerCondition triggerCondition = OrderTriggerCondition::ABOVE;
  uint8_t auctionDuration = 0;

  /** Padding bytes, which are kept so that encoding round-trips.  */
  std::string padding = std::string (3, '\0');

  Json::Value ToJson () const;
  void Encode (BorshWriter& out) const;
  void Decode (BorshReader& in);

};

/**
 * Record emitted by Drift when a new order is placed.
 */
class OrderRecord : public Event
{

public:

  static const char* const KIND;

  int64_t ts = 0;
  std::string user;
  Order order;

  OrderRecord () = default;

  std::string GetKind () const override;
  Json::Value ToJson () const override;
  std::string Encode () const override;

  static std::unique_ptr<Event> Decode (BorshReader& in);

};

/**
 * Registers all Drift event kinds this indexer knows with the registry.
 * The discriminants are the Anchor event discriminators, i.e. the first
 * eight bytes of sha256("event:<Name>").
 */
void RegisterDriftEvents (EventRegistry& registry);

} // namespace drift
} // namespace anchorx

#endif // ANCHORX_DRIFT_DRIFTEVENTS_HPP
