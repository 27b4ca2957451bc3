// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "events.hpp"

#include "private/jsonutils.hpp"

#include <glog/logging.h>

namespace anchorx
{

std::ostream&
operator<< (std::ostream& out, const Event& ev)
{
  out << ev.GetKind () << " " << StoreJson (ev.ToJson ());
  return out;
}

void
EventRegistry::Register (const std::string& discriminant,
                         const std::string& kind, const Decoder& decoder)
{
  CHECK_EQ (discriminant.size (), DISCRIMINANT_BYTES)
      << "Invalid discriminant size for " << kind;
  CHECK (decoder != nullptr);

  Entry entry;
  entry.kind = kind;
  entry.decoder = decoder;

  const auto res = kinds.emplace (discriminant, std::move (entry));
  CHECK (res.second) << "Duplicate discriminant for event kind " << kind;

  VLOG (1) << "Registered event kind " << kind;
}

std::unique_ptr<Event>
EventRegistry::Resolve (const std::string& discriminant,
                        const std::string& payload) const
{
  CHECK_EQ (discriminant.size (), DISCRIMINANT_BYTES);

  const auto mit = kinds.find (discriminant);
  if (mit == kinds.end ())
    return nullptr;

  BorshReader reader(payload);
  auto res = mit->second.decoder (reader);
  reader.Finish ();

  CHECK (res != nullptr);
  CHECK_EQ (res->GetKind (), mit->second.kind);

  return res;
}

bool
EventRegistry::GetDiscriminant (const std::string& kind,
                                std::string& res) const
{
  for (const auto& entry : kinds)
    if (entry.second.kind == kind)
      {
        res = entry.first;
        return true;
      }

  return false;
}

std::string
EventRegistry::EncodeWithDiscriminant (const Event& ev) const
{
  std::string res;
  CHECK (GetDiscriminant (ev.GetKind (), res))
      << "Event kind " << ev.GetKind () << " is not registered";
  return res + ev.Encode ();
}

} // namespace anchorx
