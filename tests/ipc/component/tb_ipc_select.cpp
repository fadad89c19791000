// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.


#include <string>

#include "gtest/gtest.h"

#include <arrow/api.h>

#include "tabxfer-common/Common.hh"
#include "tabxfer-client/Connection.hh"
#include "tabxfer-client/LocalClient.hh"

#include "support/TableHelpers.hh"

using namespace std;
using namespace tabxfer;

//Note: Additional debug info can be turned on by adding tabxfer.debug true to the config
string default_config_string = R"EOF(
# Some tests drop tables without releasing them or refuse releases
tabxfer.log.warn          false
localclient.log.warn      false
tabxfer.release.log.warn  false
)EOF";


class SelectIpc : public testing::Test {
protected:
  void SetUp() override {
    config = Configuration(default_config_string);
    client = make_shared<LocalClient>(config);
    auto c = Connection::Make(client, config);
    ASSERT_TRUE(c.ok()) << c.status().ToString();
    conn = *c;

    mixed = createMixedTable();
    client->RegisterQuery("select * from mixed_values", mixed);

    auto st = conn->LoadTable("readings", TabularData::FromTable(createReadingsTable(300)));
    ASSERT_TRUE(st.ok()) << st.ToString();
  }

  FetchOptions options(TransportMode transport, int64_t first_n=-1, bool release=false) {
    FetchOptions opts = conn->DefaultFetchOptions();
    opts.transport = transport;
    opts.first_n = first_n;
    opts.release_memory = release;
    return opts;
  }

  Configuration config;
  shared_ptr<LocalClient> client;
  shared_ptr<Connection> conn;
  shared_ptr<arrow::Table> mixed;
};


TEST_F(SelectIpc, SharedMemory) {
  auto t = conn->SelectIpc("select * from mixed_values");
  ASSERT_TRUE(t.ok()) << t.status().ToString();
  EXPECT_EQ(0, compareTables(mixed, *t));
  EXPECT_EQ(1u, conn->NumberOfTrackedResults());
  EXPECT_EQ(1u, client->NumberOfOpenResults());

  auto st = conn->Release(*t);
  EXPECT_TRUE(st.ok()) << st.ToString();
  EXPECT_EQ(0u, conn->NumberOfTrackedResults());
  EXPECT_EQ(0u, client->NumberOfOpenResults());

  //Released tables keep their data
  EXPECT_EQ(4, (*t)->num_rows());
  EXPECT_EQ(0, compareTables(mixed, *t));
}

TEST_F(SelectIpc, Wire) {
  auto t = conn->SelectIpc("select  *  from\tmixed_values; ", options(TransportMode::Inline));
  ASSERT_TRUE(t.ok()) << t.status().ToString();
  EXPECT_EQ(0, compareTables(mixed, *t));

  //Wire results are held by the server until released too
  EXPECT_EQ(1u, client->NumberOfOpenResults());
  EXPECT_TRUE(conn->DeallocateIpc(*t).ok());
  EXPECT_EQ(0u, client->NumberOfOpenResults());
}

TEST_F(SelectIpc, LoadedTable) {
  auto t = conn->SelectIpc("SELECT * FROM readings");
  ASSERT_TRUE(t.ok()) << t.status().ToString();
  EXPECT_EQ(300, (*t)->num_rows());
  EXPECT_EQ(4, (*t)->num_columns());

  auto source = createReadingsTable(300);
  EXPECT_EQ(getInt64Column(source, 1), getInt64Column(*t, 1));
  EXPECT_EQ(getStringColumn(source, 3), getStringColumn(*t, 3));
  EXPECT_TRUE(conn->Release(*t).ok());
}

TEST_F(SelectIpc, FirstN) {
  for(auto transport : {TransportMode::Inline, TransportMode::SharedSegment}) {
    auto t = conn->SelectIpc("SELECT * FROM readings", options(transport, 25));
    ASSERT_TRUE(t.ok()) << t.status().ToString();
    EXPECT_EQ(25, (*t)->num_rows());
    EXPECT_TRUE(conn->Release(*t).ok());

    //Zero rows still carries the schema
    auto t0 = conn->SelectIpc("select * from mixed_values", options(transport, 0));
    ASSERT_TRUE(t0.ok()) << t0.status().ToString();
    EXPECT_EQ(0, (*t0)->num_rows());
    EXPECT_TRUE((*t0)->schema()->Equals(*mixed->schema()));
    EXPECT_TRUE(conn->Release(*t0).ok());

    //A limit past the end returns everything
    auto t1 = conn->SelectIpc("select * from mixed_values", options(transport, 1000));
    ASSERT_TRUE(t1.ok());
    EXPECT_EQ(4, (*t1)->num_rows());
    EXPECT_TRUE(conn->Release(*t1).ok());
  }
  EXPECT_EQ(0u, client->NumberOfOpenResults());
}

TEST_F(SelectIpc, ReleaseMemory) {
  auto t = conn->SelectIpc("select * from mixed_values", options(TransportMode::SharedSegment, -1, true));
  ASSERT_TRUE(t.ok()) << t.status().ToString();
  EXPECT_EQ(0u, client->NumberOfOpenResults());
  EXPECT_EQ(0u, conn->NumberOfTrackedResults());
  EXPECT_EQ(0, compareTables(mixed, *t));

  auto st = conn->Release(*t);
  EXPECT_TRUE(IsError(st, ErrorCode::AlreadyReleased)) << st.ToString();
  EXPECT_EQ(Phase::Release, GetPhase(st));
}

TEST_F(SelectIpc, ReleaseMemoryRefused) {
  client->FailDeallocations(true);
  auto t = conn->SelectIpc("select * from mixed_values", options(TransportMode::SharedSegment, -1, true));
  ASSERT_TRUE(t.ok()) << t.status().ToString();
  EXPECT_EQ(0, compareTables(mixed, *t));

  //Still held on both sides, so it can be released once the server cooperates
  EXPECT_EQ(1u, client->NumberOfOpenResults());
  EXPECT_EQ(1u, conn->NumberOfTrackedResults());

  auto st = conn->Release(*t);
  EXPECT_TRUE(IsError(st, ErrorCode::TransportFailure)) << st.ToString();
  EXPECT_EQ(Phase::Release, GetPhase(st));

  client->FailDeallocations(false);
  st = conn->Release(*t);
  EXPECT_TRUE(st.ok()) << st.ToString();
  EXPECT_EQ(0u, client->NumberOfOpenResults());
  EXPECT_EQ(0u, conn->NumberOfTrackedResults());
}

TEST_F(SelectIpc, DoubleRelease) {
  auto t = conn->SelectIpc("select * from mixed_values");
  ASSERT_TRUE(t.ok());
  shared_ptr<arrow::Table> copy = *t;

  EXPECT_TRUE(conn->Release(*t).ok());
  auto st = conn->Release(copy);
  EXPECT_TRUE(IsError(st, ErrorCode::AlreadyReleased)) << st.ToString();
  st = conn->DeallocateIpc(copy);
  EXPECT_TRUE(IsError(st, ErrorCode::AlreadyReleased)) << st.ToString();
}

TEST_F(SelectIpc, ForeignTable) {
  auto st = conn->Release(mixed);
  EXPECT_TRUE(IsError(st, ErrorCode::NoDescriptor)) << st.ToString();
  EXPECT_EQ(Phase::Release, GetPhase(st));
  EXPECT_TRUE(st.IsKeyError());

  st = conn->Release(nullptr);
  EXPECT_TRUE(IsError(st, ErrorCode::NoDescriptor)) << st.ToString();

  //A table fetched by another connection isn't ours to release
  auto other = Connection::Make(client, config);
  ASSERT_TRUE(other.ok());
  auto t = (*other)->SelectIpc("select * from mixed_values");
  ASSERT_TRUE(t.ok());
  st = conn->Release(*t);
  EXPECT_TRUE(IsError(st, ErrorCode::NoDescriptor)) << st.ToString();
  EXPECT_TRUE((*other)->Release(*t).ok());
}

TEST_F(SelectIpc, BadQuery) {
  auto t = conn->SelectIpc("SELECT * FROM nowhere");
  ASSERT_FALSE(t.ok());
  EXPECT_TRUE(IsError(t.status(), ErrorCode::TransportFailure)) << t.status().ToString();
  EXPECT_EQ(Phase::Fetch, GetPhase(t.status()));
  EXPECT_NE(string::npos, t.status().message().find("nowhere"));
  EXPECT_EQ(0u, client->NumberOfOpenResults());
  EXPECT_EQ(0u, conn->NumberOfTrackedResults());
}

TEST_F(SelectIpc, DeviceTransportNotForCpu) {
  auto t = conn->SelectIpc("select * from mixed_values", options(TransportMode::DeviceSegment));
  ASSERT_FALSE(t.ok());
  EXPECT_TRUE(IsError(t.status(), ErrorCode::UnsupportedTransport)) << t.status().ToString();
  EXPECT_EQ(0u, client->NumberOfOpenResults());
}

TEST_F(SelectIpc, GpuWithoutAttacher) {
  auto t = conn->SelectIpcGpu("select * from mixed_values");
  ASSERT_FALSE(t.ok());
  EXPECT_TRUE(IsError(t.status(), ErrorCode::UnsupportedTransport)) << t.status().ToString();
  EXPECT_EQ(Phase::Fetch, GetPhase(t.status()));
  EXPECT_EQ(0u, client->NumberOfOpenResults());
}

TEST_F(SelectIpc, Gpu) {
  //The local server stages device results in host shared memory
  conn->RegisterAttacher(DeviceKind::GPU, make_shared<SharedMemoryAttacher>());

  FetchOptions opts = conn->DefaultFetchOptions();
  opts.device_id = 2;
  auto t = conn->SelectIpcGpu("select * from mixed_values", opts);
  ASSERT_TRUE(t.ok()) << t.status().ToString();
  EXPECT_EQ(0, compareTables(mixed, *t));
  EXPECT_EQ(1u, client->NumberOfOpenResults());

  //Telling the server it's a CPU result fails, and leaves the table releasable
  auto st = conn->DeallocateIpc(*t);
  EXPECT_TRUE(IsError(st, ErrorCode::TransportFailure)) << st.ToString();
  EXPECT_EQ(Phase::Release, GetPhase(st));
  EXPECT_EQ(1u, conn->NumberOfTrackedResults());

  st = conn->DeallocateIpcGpu(*t);
  EXPECT_TRUE(st.ok()) << st.ToString();
  EXPECT_EQ(0u, client->NumberOfOpenResults());

  st = conn->DeallocateIpcGpu(*t);
  EXPECT_TRUE(IsError(st, ErrorCode::AlreadyReleased)) << st.ToString();
  st = conn->Release(*t);
  EXPECT_TRUE(IsError(st, ErrorCode::AlreadyReleased)) << st.ToString();
}

TEST_F(SelectIpc, ManyOpenResults) {
  vector<shared_ptr<arrow::Table>> tables;
  for(int i=0; i<8; i++) {
    auto t = conn->SelectIpc("SELECT * FROM readings", options((i%2) ? TransportMode::Inline : TransportMode::SharedSegment, i+1));
    ASSERT_TRUE(t.ok()) << t.status().ToString();
    EXPECT_EQ(i+1, (*t)->num_rows());
    tables.push_back(*t);
  }
  EXPECT_EQ(8u, conn->NumberOfTrackedResults());
  EXPECT_EQ(8u, client->NumberOfOpenResults());

  for(size_t i=0; i<tables.size(); i+=2)
    EXPECT_TRUE(conn->Release(tables[i]).ok());
  EXPECT_EQ(4u, client->NumberOfOpenResults());

  //Dropping a table without releasing it leaves the server's copy alone
  tables.clear();
  EXPECT_EQ(0u, conn->NumberOfTrackedResults());
  EXPECT_EQ(4u, client->NumberOfOpenResults());
}

TEST(SelectIpcConfig, Defaults) {
  Configuration config(R"EOF(
tabxfer.fetch.transport       wire
tabxfer.fetch.first_n         2
tabxfer.fetch.release_memory  true
tabxfer.log.warn              false
)EOF");
  auto client = make_shared<LocalClient>(config);
  auto mixed = createMixedTable();
  client->RegisterQuery("select * from mixed_values", mixed);

  auto conn = Connection::Make(client, config);
  ASSERT_TRUE(conn.ok()) << conn.status().ToString();
  auto opts = (*conn)->DefaultFetchOptions();
  EXPECT_EQ(TransportMode::Inline, opts.transport);
  EXPECT_EQ(2, opts.first_n);
  EXPECT_TRUE(opts.release_memory);

  auto t = (*conn)->SelectIpc("select * from mixed_values");
  ASSERT_TRUE(t.ok()) << t.status().ToString();
  EXPECT_EQ(2, (*t)->num_rows());
  EXPECT_EQ(0u, client->NumberOfOpenResults());
}

TEST(SelectIpcConfig, BadTransport) {
  Configuration config("tabxfer.fetch.transport carrier_pigeon\n");
  auto conn = Connection::Make(make_shared<LocalClient>(config), config);
  ASSERT_FALSE(conn.ok());
  EXPECT_TRUE(IsError(conn.status(), ErrorCode::InvalidOption)) << conn.status().ToString();
}
