// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORX_EVENTS_HPP
#define ANCHORX_EVENTS_HPP

#include "borsh.hpp"

#include <json/json.h>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <string>

namespace anchorx
{

/** Length of the discriminant prefixed to every encoded event.  */
constexpr size_t DISCRIMINANT_BYTES = 8;

/**
 * A typed event decoded from a program's log output.  Each concrete
 * event kind is a subclass with a fixed field schema.  Instances are
 * immutable once decoded.
 */
class Event
{

public:

  Event () = default;
  virtual ~Event () = default;

  Event (const Event&) = delete;
  void operator= (const Event&) = delete;

  /**
   * Returns the name of this event kind, e.g. "OrderActionRecord".
   */
  virtual std::string GetKind () const = 0;

  /**
   * Returns the event's fields as JSON object.  This is the form in which
   * events are persisted and logged.
   */
  virtual Json::Value ToJson () const = 0;

  /**
   * Encodes the event's fields (without the discriminant) in the same
   * binary layout they are decoded from.
   */
  virtual std::string Encode () const = 0;

  /**
   * Two events are equal if they have the same kind and fields.  Since the
   * binary layout is canonical, this compares the encoded form.
   */
  friend bool
  operator== (const Event& a, const Event& b)
  {
    return a.GetKind () == b.GetKind () && a.Encode () == b.Encode ();
  }

  friend bool
  operator!= (const Event& a, const Event& b)
  {
    return !(a == b);
  }

  friend std::ostream& operator<< (std::ostream& out, const Event& ev);

};

/**
 * Mapping from discriminants to decoders for the event kinds of a program.
 * The registry is filled in once at startup from a table of known kinds,
 * and afterwards only read (which is thread-safe).
 */
class EventRegistry
{

public:

  /**
   * A function that decodes the fields of one event kind from the payload
   * bytes following the discriminant.  It throws DecodeError if the data
   * does not match the layout.
   */
  using Decoder = std::function<std::unique_ptr<Event> (BorshReader&)>;

private:

  /** Data stored for each registered kind.  */
  struct Entry
  {
    std::string kind;
    Decoder decoder;
  };

  /** All registered kinds by their discriminant.  */
  std::map<std::string, Entry> kinds;

public:

  EventRegistry () = default;

  EventRegistry (const EventRegistry&) = delete;
  void operator= (const EventRegistry&) = delete;

  /**
   * Registers a new event kind.  The discriminant must have exactly
   * DISCRIMINANT_BYTES bytes and must not be registered yet.
   */
  void Register (const std::string& discriminant, const std::string& kind,
                 const Decoder& decoder);

  /**
   * Looks up the discriminant and decodes the payload with the matching
   * decoder.  Returns null if the discriminant is unknown.  Throws
   * DecodeError if it is known, but the payload does not conform
   * exactly to the layout (including trailing data).
   */
  std::unique_ptr<Event> Resolve (const std::string& discriminant,
                                  const std::string& payload) const;

  /**
   * Looks up the discriminant of a given kind.  Returns false if the kind
   * is not registered.
   */
  bool GetDiscriminant (const std::string& kind, std::string& res) const;

  /**
   * Encodes an event with its discriminant prefix, i.e. as the emitting
   * program does it.  The event's kind must be registered.
   */
  std::string EncodeWithDiscriminant (const Event& ev) const;

  size_t
  GetNumKinds () const
  {
    return kinds.size ();
  }

};

} // namespace anchorx

#endif // ANCHORX_EVENTS_HPP
