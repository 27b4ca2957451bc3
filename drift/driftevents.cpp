// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "driftevents.hpp"

#include "base58.hpp"
#include "private/jsonutils.hpp"

#include <glog/logging.h>

namespace anchorx
{
namespace drift
{

namespace
{

/* Variant names of the IDL enums, indexed by their Borsh tag.  */

const char* const ORDER_ACTION_NAMES[] =
  {
    "Place", "Cancel", "Fill", "Trigger", "Expire",
  };

const char* const ORDER_ACTION_EXPLANATION_NAMES[] =
  {
    "None",
    "InsufficientFreeCollateral",
    "OraclePriceBreachedLimitPrice",
    "MarketOrderFilledToLimitPrice",
    "OrderExpired",
    "CanceledForLiquidation",
    "OrderFilledWithAMM",
    "OrderFilledWithAMMJit",
    "OrderFilledWithMatch",
    "OrderFilledWithMatchJit",
    "MarketExpired",
    "RiskingIncreasingOrder",
    "ReduceOnlyOrderIncreasedPosition",
    "OrderFillWithSerum",
    "NoBorrowLiquidity",
    "OrderFillWithPhoenix",
    "OrderFilledWithAMMJitLPSplit",
    "OrderFilledWithLPJit",
    "DeriskLp",
  };

const char* const MARKET_TYPE_NAMES[] = {"Spot", "Perp"};
const char* const POSITION_DIRECTION_NAMES[] = {"Long", "Short"};
const char* const ORDER_STATUS_NAMES[] = {"Init", "Open", "Filled", "Canceled"};

const char* const ORDER_TYPE_NAMES[] =
  {
    "Market", "Limit", "TriggerMarket", "TriggerLimit", "Oracle",
  };

const char* const ORDER_TRIGGER_CONDITION_NAMES[] =
  {
    "Above", "Below", "TriggeredAbove", "TriggeredBelow",
  };

/**
 * Reads an enum value given the table of its variant names (which
 * determines the number of variants).
 */
template <typename E, size_t N>
  E
  ReadEnumValue (BorshReader& in, const char* name,
                 const char* const (&names)[N])
{
  return static_cast<E> (in.ReadEnum (name, N));
}

/**
 * Returns the JSON representation (the variant name) of an enum value.
 */
template <typename E, size_t N>
  Json::Value
  EnumToJson (const E val, const char* const (&names)[N])
{
  const auto ind = static_cast<size_t> (val);
  CHECK_LT (ind, N);
  return names[ind];
}

template <typename E>
  void
  WriteEnumValue (BorshWriter& out, const E val)
{
  out.WriteU8 (static_cast<uint8_t> (val));
}

std::optional<PositionDirection>
ReadOptionalDirection (BorshReader& in)
{
  if (!in.ReadOptionTag ())
    return std::nullopt;
  return ReadEnumValue<PositionDirection> (in, "PositionDirection",
                                           POSITION_DIRECTION_NAMES);
}

void
WriteOptionalDirection (BorshWriter& out,
                        const std::optional<PositionDirection>& val)
{
  if (!val)
    {
      out.WriteU8 (0);
      return;
    }
  out.WriteU8 (1);
  WriteEnumValue (out, *val);
}

Json::Value
PubkeyToJson (const std::string& key)
{
  return EncodeBase58 (key);
}

template <typename T>
  Json::Value
  OptionalToJson (const std::optional<T>& val)
{
  if (!val)
    return Json::Value ();
  return UintToJson (*val);
}

Json::Value
OptionalToJson (const std::optional<int64_t>& val)
{
  if (!val)
    return Json::Value ();
  return IntToJson (*val);
}

Json::Value
OptionalToJson (const std::optional<std::string>& key)
{
  if (!key)
    return Json::Value ();
  return PubkeyToJson (*key);
}

Json::Value
OptionalToJson (const std::optional<PositionDirection>& val)
{
  if (!val)
    return Json::Value ();
  return EnumToJson (*val, POSITION_DIRECTION_NAMES);
}

/** Anchor event discriminator of OrderActionRecord.  */
const unsigned char ORDER_ACTION_RECORD_DISCRIMINANT[] =
  {
    0xe0, 0x34, 0x43, 0x47, 0xc2, 0xed, 0x6d, 0x01,
  };

/** Anchor event discriminator of OrderRecord.  */
const unsigned char ORDER_RECORD_DISCRIMINANT[] =
  {
    0x68, 0x13, 0x40, 0x38, 0x59, 0x15, 0x02, 0x5a,
  };

template <size_t N>
  std::string
  BytesToString (const unsigned char (&bytes)[N])
{
  return std::string (reinterpret_cast<const char*> (bytes), N);
}

} // anonymous namespace

/* ************************************************************************** */

const char* const OrderActionRecord::KIND = "OrderActionRecord";

std::string
OrderActionRecord::GetKind () const
{
  return KIND;
}

Json::Value
OrderActionRecord::ToJson () const
{
  Json::Value res(Json::objectValue);

  res["ts"] = IntToJson (ts);
  res["action"] = EnumToJson (action, ORDER_ACTION_NAMES);
  res["actionExplanation"]
      = EnumToJson (actionExplanation, ORDER_ACTION_EXPLANATION_NAMES);
  res["marketIndex"] = static_cast<Json::UInt> (marketIndex);
  res["marketType"] = EnumToJson (marketType, MARKET_TYPE_NAMES);

  res["filler"] = OptionalToJson (filler);
  res["fillerReward"] = OptionalToJson (fillerReward);
  res["fillRecordId"] = OptionalToJson (fillRecordId);
  res["baseAssetAmountFilled"] = OptionalToJson (baseAssetAmountFilled);
  res["quoteAssetAmountFilled"] = OptionalToJson (quoteAssetAmountFilled);
  res["takerFee"] = OptionalToJson (takerFee);
  res["makerFee"] = OptionalToJson (makerFee);
  res["referrerReward"] = OptionalToJson (referrerReward);
  res["quoteAssetAmountSurplus"] = OptionalToJson (quoteAssetAmountSurplus);
  res["spotFulfillmentMethodFee"] = OptionalToJson (spotFulfillmentMethodFee);

  res["taker"] = OptionalToJson (taker);
  res["takerOrderId"] = OptionalToJson (takerOrderId);
  res["takerOrderDirection"] = OptionalToJson (takerOrderDirection);
  res["takerOrderBaseAssetAmount"] = OptionalToJson (takerOrderBaseAssetAmount);
  res["takerOrderCumulativeBaseAssetAmountFilled"]
      = OptionalToJson (takerOrderCumulativeBaseAssetAmountFilled);
  res["takerOrderCumulativeQuoteAssetAmountFilled"]
      = OptionalToJson (takerOrderCumulativeQuoteAssetAmountFilled);

  res["maker"] = OptionalToJson (maker);
  res["makerOrderId"] = OptionalToJson (makerOrderId);
  res["makerOrderDirection"] = OptionalToJson (makerOrderDirection);
  res["makerOrderBaseAssetAmount"] = OptionalToJson (makerOrderBaseAssetAmount);
  res["makerOrderCumulativeBaseAssetAmountFilled"]
      = OptionalToJson (makerOrderCumulativeBaseAssetAmountFilled);
  res["makerOrderCumulativeQuoteAssetAmountFilled"]
      = OptionalToJson (makerOrderCumulativeQuoteAssetAmountFilled);

  res["oraclePrice"] = IntToJson (oraclePrice);

  return res;
}

std::string
OrderActionRecord::Encode () const
{
  BorshWriter out;

  out.WriteI64 (ts);
  WriteEnumValue (out, action);
  WriteEnumValue (out, actionExplanation);
  out.WriteU16 (marketIndex);
  WriteEnumValue (out, marketType);

  out.WriteOption (filler, &BorshWriter::WritePubkey);
  out.WriteOption (fillerReward, &BorshWriter::WriteU64);
  out.WriteOption (fillRecordId, &BorshWriter::WriteU64);
  out.WriteOption (baseAssetAmountFilled, &BorshWriter::WriteU64);
  out.WriteOption (quoteAssetAmountFilled, &BorshWriter::WriteU64);
  out.WriteOption (takerFee, &BorshWriter::WriteU64);
  out.WriteOption (makerFee, &BorshWriter::WriteI64);
  out.WriteOption (referrerReward, &BorshWriter::WriteU32);
  out.WriteOption (quoteAssetAmountSurplus, &BorshWriter::WriteI64);
  out.WriteOption (spotFulfillmentMethodFee, &BorshWriter::WriteU64);

  out.WriteOption (taker, &BorshWriter::WritePubkey);
  out.WriteOption (takerOrderId, &BorshWriter::WriteU32);
  WriteOptionalDirection (out, takerOrderDirection);
  out.WriteOption (takerOrderBaseAssetAmount, &BorshWriter::WriteU64);
  out.WriteOption (takerOrderCumulativeBaseAssetAmountFilled,
                   &BorshWriter::WriteU64);
  out.WriteOption (takerOrderCumulativeQuoteAssetAmountFilled,
                   &BorshWriter::WriteU64);

  out.WriteOption (maker, &BorshWriter::WritePubkey);
  out.WriteOption (makerOrderId, &BorshWriter::WriteU32);
  WriteOptionalDirection (out, makerOrderDirection);
  out.WriteOption (makerOrderBaseAssetAmount, &BorshWriter::WriteU64);
  out.WriteOption (makerOrderCumulativeBaseAssetAmountFilled,
                   &BorshWriter::WriteU64);
  out.WriteOption (makerOrderCumulativeQuoteAssetAmountFilled,
                   &BorshWriter::WriteU64);

  out.WriteI64 (oraclePrice);

  return out.GetData ();
}

std::unique_ptr<Event>
OrderActionRecord::Decode (BorshReader& in)
{
  auto res = std::make_unique<OrderActionRecord> ();

  res->ts = in.ReadI64 ();
  res->action
      = ReadEnumValue<OrderAction> (in, "OrderAction", ORDER_ACTION_NAMES);
  res->actionExplanation = ReadEnumValue<OrderActionExplanation> (
      in, "OrderActionExplanation", ORDER_ACTION_EXPLANATION_NAMES);
  res->marketIndex = in.ReadU16 ();
  res->marketType
      = ReadEnumValue<MarketType> (in, "MarketType", MARKET_TYPE_NAMES);

  res->filler = in.ReadOption (&BorshReader::ReadPubkey);
  res->fillerReward = in.ReadOption (&BorshReader::ReadU64);
  res->fillRecordId = in.ReadOption (&BorshReader::ReadU64);
  res->baseAssetAmountFilled = in.ReadOption (&BorshReader::ReadU64);
  res->quoteAssetAmountFilled = in.ReadOption (&BorshReader::ReadU64);
  res->takerFee = in.ReadOption (&BorshReader::ReadU64);
  res->makerFee = in.ReadOption (&BorshReader::ReadI64);
  res->referrerReward = in.ReadOption (&BorshReader::ReadU32);
  res->quoteAssetAmountSurplus = in.ReadOption (&BorshReader::ReadI64);
  res->spotFulfillmentMethodFee = in.ReadOption (&BorshReader::ReadU64);

  res->taker = in.ReadOption (&BorshReader::ReadPubkey);
  res->takerOrderId = in.ReadOption (&BorshReader::ReadU32);
  res->takerOrderDirection = ReadOptionalDirection (in);
  res->takerOrderBaseAssetAmount = in.ReadOption (&BorshReader::ReadU64);
  res->takerOrderCumulativeBaseAssetAmountFilled
      = in.ReadOption (&BorshReader::ReadU64);
  res->takerOrderCumulativeQuoteAssetAmountFilled
      = in.ReadOption (&BorshReader::ReadU64);

  res->maker = in.ReadOption (&BorshReader::ReadPubkey);
  res->makerOrderId = in.ReadOption (&BorshReader::ReadU32);
  res->makerOrderDirection = ReadOptionalDirection (in);
  res->makerOrderBaseAssetAmount = in.ReadOption (&BorshReader::ReadU64);
  res->makerOrderCumulativeBaseAssetAmountFilled
      = in.ReadOption (&BorshReader::ReadU64);
  res->makerOrderCumulativeQuoteAssetAmountFilled
      = in.ReadOption (&BorshReader::ReadU64);

  res->oraclePrice = in.ReadI64 ();

  return res;
}

/* ************************************************************************** */

Json::Value
Order::ToJson () const
{
  Json::Value res(Json::objectValue);

  res["slot"] = UintToJson (slot);
  res["price"] = UintToJson (price);
  res["baseAssetAmount"] = UintToJson (baseAssetAmount);
  res["baseAssetAmountFilled"] = UintToJson (baseAssetAmountFilled);
  res["quoteAssetAmountFilled"] = UintToJson (quoteAssetAmountFilled);
  res["triggerPrice"] = UintToJson (triggerPrice);
  res["auctionStartPrice"] = IntToJson (auctionStartPrice);
  res["auctionEndPrice"] = IntToJson (auctionEndPrice);
  res["maxTs"] = IntToJson (maxTs);
  res["oraclePriceOffset"] = oraclePriceOffset;
  res["orderId"] = orderId;
  res["marketIndex"] = static_cast<Json::UInt> (marketIndex);
  res["status"] = EnumToJson (status, ORDER_STATUS_NAMES);
  res["orderType"] = EnumToJson (orderType, ORDER_TYPE_NAMES);
  res["marketType"] = EnumToJson (marketType, MARKET_TYPE_NAMES);
  res["userOrderId"] = static_cast<Json::UInt> (userOrderId);
  res["existingPositionDirection"]
      = EnumToJson (existingPositionDirection, POSITION_DIRECTION_NAMES);
  res["direction"] = EnumToJson (direction, POSITION_DIRECTION_NAMES);
  res["reduceOnly"] = reduceOnly;
  res["postOnly"] = postOnly;
  res["immediateOrCancel"] = immediateOrCancel;
  res["triggerCondition"]
      = EnumToJson (triggerCondition, ORDER_TRIGGER_CONDITION_NAMES);
  res["auctionDuration"] = static_cast<Json::UInt> (auctionDuration);

  return res;
}

void
Order::Encode (BorshWriter& out) const
{
  out.WriteU64 (slot);
  out.WriteU64 (price);
  out.WriteU64 (baseAssetAmount);
  out.WriteU64 (baseAssetAmountFilled);
  out.WriteU64 (quoteAssetAmountFilled);
  out.WriteU64 (triggerPrice);
  out.WriteI64 (auctionStartPrice);
  out.WriteI64 (auctionEndPrice);
  out.WriteI64 (maxTs);
  out.WriteI32 (oraclePriceOffset);
  out.WriteU32 (orderId);
  out.WriteU16 (marketIndex);
  WriteEnumValue (out, status);
  WriteEnumValue (out, orderType);
  WriteEnumValue (out, marketType);
  out.WriteU8 (userOrderId);
  WriteEnumValue (out, existingPositionDirection);
  WriteEnumValue (out, direction);
  out.WriteBool (reduceOnly);
  out.WriteBool (postOnly);
  out.WriteBool (immediateOrCancel);
  WriteEnumValue (out, triggerCondition);
  out.WriteU8 (auctionDuration);

  CHECK_EQ (padding.size (), 3u);
  out.WriteBytes (padding);
}

void
Order::Decode (BorshReader& in)
{
  slot = in.ReadU64 ();
  price = in.ReadU64 ();
  baseAssetAmount = in.ReadU64 ();
  baseAssetAmountFilled = in.ReadU64 ();
  quoteAssetAmountFilled = in.ReadU64 ();
  triggerPrice = in.ReadU64 ();
  auctionStartPrice = in.ReadI64 ();
  auctionEndPrice = in.ReadI64 ();
  maxTs = in.ReadI64 ();
  oraclePriceOffset = in.ReadI32 ();
  orderId = in.ReadU32 ();
  marketIndex = in.ReadU16 ();
  status = ReadEnumValue<OrderStatus> (in, "OrderStatus", ORDER_STATUS_NAMES);
  orderType = ReadEnumValue<OrderType> (in, "OrderType", ORDER_TYPE_NAMES);
  marketType = ReadEnumValue<MarketType> (in, "MarketType", MARKET_TYPE_NAMES);
  userOrderId = in.ReadU8 ();
  existingPositionDirection = ReadEnumValue<PositionDirection> (
      in, "PositionDirection", POSITION_DIRECTION_NAMES);
  direction = ReadEnumValue<PositionDirection> (
      in, "PositionDirection", POSITION_DIRECTION_NAMES);
  reduceOnly = in.ReadBool ();
  postOnly = in.ReadBool ();
  immediateOrCancel = in.ReadBool ();
  triggerCondition = ReadEnumValue<OrderTriggerCondition> (
      in, "OrderTriggerCondition", ORDER_TRIGGER_CONDITION_NAMES);
  auctionDuration = in.ReadU8 ();
  padding = in.ReadBytes (3);
}

/* ************************************************************************** */

const char* const OrderRecord::KIND = "OrderRecord";

std::string
OrderRecord::GetKind () const
{
  return KIND;
}

Json::Value
OrderRecord::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["ts"] = IntToJson (ts);
  res["user"] = PubkeyToJson (user);
  res["order"] = order.ToJson ();

  return res;
}

std::string
OrderRecord::Encode () const
{
  BorshWriter out;
  out.WriteI64 (ts);
  out.WritePubkey (user);
  order.Encode (out);

  return out.GetData ();
}

std::unique_ptr<Event>
OrderRecord::Decode (BorshReader& in)
{
  auto res = std::make_unique<OrderRecord> ();
  res->ts = in.ReadI64 ();
  res->user = in.ReadPubkey ();
  res->order.Decode (in);

  return res;
}

/* ************************************************************************** */

void
RegisterDriftEvents (EventRegistry& registry)
{
  registry.Register (BytesToString (ORDER_ACTION_RECORD_DISCRIMINANT),
                     OrderActionRecord::KIND, &OrderActionRecord::Decode);
  registry.Register (BytesToString (ORDER_RECORD_DISCRIMINANT),
                     OrderRecord::KIND, &OrderRecord::Decode);
}

} // namespace drift
} // namespace anchorx
