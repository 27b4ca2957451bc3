// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "eventstore.hpp"
#include "sqlitestore.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

#include <thread>

namespace anchorx
{
namespace
{

/**
 * Constructs an in-memory instance of each store type.
 */
template <typename T>
  std::unique_ptr<T> CreateStore ();

template <>
  std::unique_ptr<InMemoryEventStore>
  CreateStore<InMemoryEventStore> ()
{
  return std::make_unique<InMemoryEventStore> ();
}

template <>
  std::unique_ptr<SqliteEventStore>
  CreateStore<SqliteEventStore> ()
{
  return std::make_unique<SqliteEventStore> (":memory:");
}

template <typename T>
  class EventStoreTests : public testing::Test
{

protected:

  std::unique_ptr<EventStore> store;

  EventStoreTests ()
    : store(CreateStore<T> ())
  {}

};

using StoreTypes = testing::Types<InMemoryEventStore, SqliteEventStore>;
TYPED_TEST_SUITE (EventStoreTests, StoreTypes);

TYPED_TEST (EventStoreTests, Cursor)
{
  std::string sgn;
  EXPECT_FALSE (this->store->GetCursor ("acc", sgn));

  this->store->SetCursor ("acc", "sgn1");
  ASSERT_TRUE (this->store->GetCursor ("acc", sgn));
  EXPECT_EQ (sgn, "sgn1");

  this->store->SetCursor ("acc", "sgn2");
  this->store->SetCursor ("other", "sgn3");
  ASSERT_TRUE (this->store->GetCursor ("acc", sgn));
  EXPECT_EQ (sgn, "sgn2");
  ASSERT_TRUE (this->store->GetCursor ("other", sgn));
  EXPECT_EQ (sgn, "sgn3");
}

TYPED_TEST (EventStoreTests, Events)
{
  EXPECT_TRUE (this->store->InsertEvent ("sgn1", 0, TestEvent (10)));
  EXPECT_TRUE (this->store->InsertEvent ("sgn1", 1, TestEvent (11, true)));
  EXPECT_TRUE (this->store->InsertEvent ("sgn2", 0, TestEvent (20)));

  const auto events = this->store->GetEvents ();
  ASSERT_EQ (events.size (), 3);

  EXPECT_EQ (events[0].signature, "sgn1");
  EXPECT_EQ (events[0].position, 0);
  EXPECT_EQ (events[0].kind, "TestEvent");
  EXPECT_EQ (events[0].data["value"].asUInt64 (), 10);
  EXPECT_FALSE (events[0].data["flag"].asBool ());

  EXPECT_EQ (events[1].signature, "sgn1");
  EXPECT_EQ (events[1].position, 1);
  EXPECT_EQ (events[1].data["value"].asUInt64 (), 11);
  EXPECT_TRUE (events[1].data["flag"].asBool ());

  EXPECT_EQ (events[2].signature, "sgn2");
  EXPECT_EQ (events[2].position, 0);
}

TYPED_TEST (EventStoreTests, DuplicatesAreIgnored)
{
  EXPECT_TRUE (this->store->InsertEvent ("sgn", 0, TestEvent (1)));
  EXPECT_FALSE (this->store->InsertEvent ("sgn", 0, TestEvent (1)));
  EXPECT_FALSE (this->store->InsertEvent ("sgn", 0, TestEvent (2)));

  const auto events = this->store->GetEvents ();
  ASSERT_EQ (events.size (), 1);
  EXPECT_EQ (events[0].data["value"].asUInt64 (), 1);
}

TYPED_TEST (EventStoreTests, ConcurrentAccess)
{
  std::vector<std::thread> threads;
  for (unsigned i = 0; i < 4; ++i)
    threads.emplace_back ([this, i] ()
      {
        const std::string sgn = "sgn" + std::to_string (i);
        for (unsigned j = 0; j < 10; ++j)
          this->store->InsertEvent (sgn, j, TestEvent (j));
        this->store->SetCursor ("acc" + std::to_string (i), sgn);
      });
  for (auto& t : threads)
    t.join ();

  EXPECT_EQ (this->store->GetEvents ().size (), 40);
  for (unsigned i = 0; i < 4; ++i)
    {
      std::string sgn;
      ASSERT_TRUE (this->store->GetCursor ("acc" + std::to_string (i), sgn));
      EXPECT_EQ (sgn, "sgn" + std::to_string (i));
    }
}

/* ************************************************************************** */

using SqliteEventStoreTests = testing::Test;

TEST_F (SqliteEventStoreTests, InvalidFile)
{
  EXPECT_THROW (SqliteEventStore ("/nonexistent/dir/db.sqlite"),
                StorageError);
}

} // anonymous namespace
} // namespace anchorx
