// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.


#include <algorithm>
#include <numeric>
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
# Injected failures are expected here
localclient.log.warn false
)EOF";


class LoadPipeline : public testing::Test {
protected:
  void SetUp() override {
    config = Configuration(default_config_string);
    client = make_shared<LocalClient>(config);
    auto c = Connection::Make(client, config);
    ASSERT_TRUE(c.ok()) << c.status().ToString();
    conn = *c;
  }

  int64_t loadedRows() {
    auto rows = client->GetLoadCallRows();
    return accumulate(rows.begin(), rows.end(), int64_t(0));
  }

  Configuration config;
  shared_ptr<LocalClient> client;
  shared_ptr<Connection> conn;
};


TEST_F(LoadPipeline, CreateInferArrow) {
  auto source = createReadingsTable(500);
  auto st = conn->LoadTable("readings", TabularData::FromTable(source));
  ASSERT_TRUE(st.ok()) << st.ToString();

  auto tables = conn->GetTables();
  ASSERT_TRUE(tables.ok());
  EXPECT_EQ(vector<string>({"readings"}), *tables);

  auto details = conn->GetTableDetails("readings");
  ASSERT_TRUE(details.ok());
  ASSERT_EQ(4, details->size());
  EXPECT_EQ(LogicalType::TIMESTAMP, (*details)[0].type);
  EXPECT_EQ(ColumnSpec("Label", LogicalType::STR, true, 0, 0, 32, Encoding::DICT), (*details)[3]);

  EXPECT_EQ(1, client->NumberOfLoadCalls());
  auto stored = client->GetTable("readings");
  ASSERT_TRUE(stored.ok());
  EXPECT_EQ(0, compareTables(source, *stored));

  //Table exists now, so a second infer load only appends
  st = conn->LoadTable("readings", TabularData::FromTable(source));
  ASSERT_TRUE(st.ok()) << st.ToString();
  stored = client->GetTable("readings");
  EXPECT_EQ(1000, (*stored)->num_rows());
}

TEST_F(LoadPipeline, CreatePolicies) {
  auto source = createIntTable(10, 2);

  LoadOptions never;
  never.create = "false";
  auto st = conn->LoadTable("ints", TabularData::FromTable(source), never);
  EXPECT_TRUE(IsError(st, ErrorCode::TransportFailure));
  EXPECT_EQ(Phase::Load, GetPhase(st));

  LoadOptions always;
  always.create = "true";
  st = conn->LoadTable("ints", TabularData::FromTable(source), always);
  ASSERT_TRUE(st.ok()) << st.ToString();

  st = conn->LoadTable("ints", TabularData::FromTable(source), always);
  EXPECT_TRUE(IsError(st, ErrorCode::TableExists));
  EXPECT_EQ(Phase::Create, GetPhase(st));
  EXPECT_EQ(10, (*client->GetTable("ints"))->num_rows());

  st = conn->CreateTable("ints", TabularData::FromTable(source));
  EXPECT_TRUE(IsError(st, ErrorCode::TableExists));
}

//A server that reports existing tables without saying which error it is
class UntaggedCreateClient : public LocalClient {
public:
  explicit UntaggedCreateClient(const Configuration &config) : LocalClient(config) {}
  arrow::Status CreateTable(const string &table_name, const vector<ColumnSpec> &specs) override {
    auto st = LocalClient::CreateTable(table_name, specs);
    if(st.ok()) return st;
    return arrow::Status::Invalid(st.message());
  }
};

TEST(LoadPipelineClient, CreateNeedsTableExistsDetail) {
  Configuration config(default_config_string);
  auto client = make_shared<UntaggedCreateClient>(config);
  auto conn = Connection::Make(client, config);
  ASSERT_TRUE(conn.ok());

  auto data = TabularData::FromTable(createIntTable(4, 2));
  ASSERT_TRUE((*conn)->CreateTable("ints", data).ok());

  //Without the detail the refusal is only a transport failure
  auto st = (*conn)->CreateTable("ints", data);
  EXPECT_TRUE(IsError(st, ErrorCode::TransportFailure)) << st.ToString();
  EXPECT_EQ(Phase::Create, GetPhase(st));
  EXPECT_FALSE(IsError(st, ErrorCode::TableExists));
}

TEST_F(LoadPipeline, ColumnarChunks) {
  auto source = createReadingsTable(1000);
  LoadOptions opts;
  opts.method = "columnar";
  opts.chunk_size_bytes = 2048;
  auto st = conn->LoadTable("readings", TabularData::FromTable(source), opts);
  ASSERT_TRUE(st.ok()) << st.ToString();

  EXPECT_GT(client->NumberOfLoadCalls(), 1);
  EXPECT_EQ(1000, loadedRows());
  EXPECT_EQ(0, compareTables(source, *client->GetTable("readings")));
}

TEST_F(LoadPipeline, ColumnarSchemaMismatch) {
  ASSERT_TRUE(conn->CreateTable("ints", TabularData::FromTable(createIntTable(1, 2))).ok());

  LoadOptions opts;
  opts.method = "columnar";
  auto st = conn->LoadTable("ints", TabularData::FromTable(createIntTable(10, 3)), opts);
  EXPECT_TRUE(IsError(st, ErrorCode::SchemaMismatch));
  EXPECT_EQ(Phase::Load, GetPhase(st));
  EXPECT_EQ(0, client->NumberOfLoadCalls());

  //Naming a column the table doesn't have is the same problem
  opts.column_names = {"c0", "nope"};
  st = conn->LoadTable("ints", TabularData::FromTable(createIntTable(10, 2)), opts);
  EXPECT_TRUE(IsError(st, ErrorCode::SchemaMismatch));
  EXPECT_EQ(0, client->NumberOfLoadCalls());
}

TEST_F(LoadPipeline, ColumnarTypeMismatch) {
  auto target = arrow::schema({arrow::field("n", arrow::int32())});
  auto empty = arrow::Table::Make(target, {arrow::MakeArrayOfNull(arrow::int32(), 0).ValueOrDie()}, 0);
  ASSERT_TRUE(conn->CreateTable("narrow", TabularData::FromTable(empty)).ok());

  arrow::Int64Builder b;
  ASSERT_TRUE(b.Append(1LL<<40).ok());
  shared_ptr<arrow::Array> big;
  ASSERT_TRUE(b.Finish(&big).ok());
  auto source = arrow::Table::Make(arrow::schema({arrow::field("n", arrow::int64())}), {big}, 1);

  LoadOptions opts;
  opts.method = "columnar";
  auto st = conn->LoadTable("narrow", TabularData::FromTable(source), opts);
  EXPECT_TRUE(IsError(st, ErrorCode::TypeMismatch));
  EXPECT_EQ(Phase::Load, GetPhase(st));
  EXPECT_EQ(0, client->NumberOfLoadCalls());

  //The server makes the same check for arrow loads
  opts.method = "arrow";
  st = conn->LoadTable("narrow", TabularData::FromTable(source), opts);
  EXPECT_TRUE(IsError(st, ErrorCode::TypeMismatch));
  EXPECT_EQ(Phase::Load, GetPhase(st));
}

TEST_F(LoadPipeline, RowWise) {
  RowSet rows = { makeRow({arrow::MakeScalar(int64_t(1)), make_shared<arrow::StringScalar>("a")}),
                  makeRow({arrow::MakeScalar(int64_t(2)), make_shared<arrow::StringScalar>("b")}),
                  makeRow({arrow::MakeScalar(int64_t(3)), make_shared<arrow::StringScalar>("c")}) };
  auto st = conn->LoadTable("letters", TabularData::FromRows(rows, {"id", "name"}));
  ASSERT_TRUE(st.ok()) << st.ToString();

  EXPECT_EQ(1, client->NumberOfLoadCalls());
  auto stored = client->GetTable("letters");
  ASSERT_TRUE(stored.ok());
  EXPECT_EQ(3, (*stored)->num_rows());
  EXPECT_EQ(vector<int64_t>({1, 2, 3}), getInt64Column(*stored, 0));
  EXPECT_EQ(vector<string>({"a", "b", "c"}), getStringColumn(*stored, 1));
}

TEST_F(LoadPipeline, SameResultEveryMethod) {
  auto source = createMixedTable();
  for(string method : {"arrow", "columnar", "rows"}) {
    LoadOptions opts;
    opts.method = method;
    opts.chunk_size_bytes = 16; //Every row is bigger than this, so columnar sends one row per batch
    auto st = conn->LoadTable("mixed_"+method, TabularData::FromTable(source), opts);
    ASSERT_TRUE(st.ok()) << method << ": " << st.ToString();
    auto stored = client->GetTable("mixed_"+method);
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(0, compareTables(source, *stored)) << method;
  }
}

TEST_F(LoadPipeline, DecimalPrecisionEveryMethod) {
  auto target = arrow::schema({arrow::field("price", arrow::decimal128(5, 2))});
  auto empty = arrow::Table::Make(target, {arrow::MakeArrayOfNull(arrow::decimal128(5, 2), 0).ValueOrDie()}, 0);
  ASSERT_TRUE(conn->CreateTable("prices", TabularData::FromTable(empty)).ok());

  auto makePrices = [](const vector<double> &vals) {
    arrow::DoubleBuilder b;
    for(auto v : vals) EXPECT_TRUE(b.Append(v).ok());
    shared_ptr<arrow::Array> out;
    EXPECT_TRUE(b.Finish(&out).ok());
    return arrow::Table::Make(arrow::schema({arrow::field("price", arrow::float64())}), {out});
  };
  auto too_wide = makePrices({1.5, 12345.67});
  auto widest   = makePrices({999.99});

  int64_t expected_rows=0;
  for(string method : {"arrow", "columnar", "rows"}) {
    LoadOptions opts;
    opts.method = method;
    auto st = conn->LoadTable("prices", TabularData::FromTable(too_wide), opts);
    EXPECT_TRUE(IsError(st, ErrorCode::TypeMismatch)) << method << ": " << st.ToString();
    EXPECT_EQ(Phase::Load, GetPhase(st)) << method;
    EXPECT_EQ(expected_rows, (*client->GetTable("prices"))->num_rows()) << method;
    expected_rows++;

    st = conn->LoadTable("prices", TabularData::FromTable(widest), opts);
    EXPECT_TRUE(st.ok()) << method << ": " << st.ToString();
  }

  auto stored = *client->GetTable("prices");
  ASSERT_EQ(3, stored->num_rows());
  auto prices = static_pointer_cast<arrow::Decimal128Array>(stored->column(0)->chunk(0));
  EXPECT_EQ("999.99", prices->FormatValue(0));
  EXPECT_TRUE(stored->ValidateFull().ok());
}

TEST_F(LoadPipeline, ColumnSubset) {
  auto full = arrow::schema({arrow::field("id",    arrow::int64()),
                             arrow::field("name",  arrow::utf8()),
                             arrow::field("score", arrow::float64())});
  arrow::ArrayVector empty;
  for(auto &f : full->fields())
    empty.push_back(arrow::MakeArrayOfNull(f->type(), 0).ValueOrDie());
  ASSERT_TRUE(conn->CreateTable("people", TabularData::FromTable(arrow::Table::Make(full, empty, 0))).ok());

  RowSet rows = { makeRow({make_shared<arrow::StringScalar>("ann"), arrow::MakeScalar(int64_t(7))}),
                  makeRow({make_shared<arrow::StringScalar>("bob"), arrow::MakeScalar(int64_t(8))}) };
  LoadOptions opts;
  opts.method = "columnar";
  opts.column_names = {"name", "id"};
  auto st = conn->LoadTable("people", TabularData::FromRows(rows), opts);
  ASSERT_TRUE(st.ok()) << st.ToString();

  auto stored = *client->GetTable("people");
  EXPECT_EQ(vector<int64_t>({7, 8}), getInt64Column(stored, 0));
  EXPECT_EQ(vector<string>({"ann", "bob"}), getStringColumn(stored, 1));
  EXPECT_EQ(2, stored->column(2)->null_count());
}

TEST_F(LoadPipeline, PartialFailure) {
  auto source = createReadingsTable(1000);
  ASSERT_TRUE(conn->CreateTable("readings", TabularData::FromTable(source)).ok());

  client->FailLoadAfter(2);
  LoadOptions opts;
  opts.method = "columnar";
  opts.chunk_size_bytes = 2048;
  auto st = conn->LoadTable("readings", TabularData::FromTable(source), opts);
  EXPECT_TRUE(IsError(st, ErrorCode::TransportFailure));
  EXPECT_EQ(Phase::Load, GetPhase(st));
  EXPECT_TRUE(st.IsIOError());
  EXPECT_NE(string::npos, st.message().find("Injected failure"));

  //No rollback: the first two batches stay
  EXPECT_EQ(2, client->NumberOfLoadCalls());
  auto stored = client->GetTable("readings");
  EXPECT_EQ(loadedRows(), (*stored)->num_rows());
  EXPECT_GT((*stored)->num_rows(), 0);
  EXPECT_LT((*stored)->num_rows(), 1000);
}

TEST_F(LoadPipeline, BadOptionsSendNothing) {
  auto data = TabularData::FromTable(createIntTable(5, 1));

  LoadOptions bad_method;
  bad_method.method = "csv";
  auto st = conn->LoadTable("t", data, bad_method);
  EXPECT_TRUE(IsError(st, ErrorCode::InvalidMethod));

  LoadOptions bad_create;
  bad_create.create = "maybe";
  st = conn->LoadTable("t", data, bad_create);
  EXPECT_TRUE(IsError(st, ErrorCode::InvalidOption));

  EXPECT_TRUE(conn->GetTables()->empty());
  EXPECT_EQ(0, client->NumberOfLoadCalls());
}

TEST_F(LoadPipeline, ExplicitEntryPoints) {
  auto source = createIntTable(20, 2);
  ASSERT_TRUE(conn->CreateTable("ints", TabularData::FromTable(source)).ok());
  ASSERT_TRUE(conn->LoadTableArrow("ints", TabularData::FromTable(source)).ok());
  ASSERT_TRUE(conn->LoadTableColumnar("ints", TabularData::FromTable(source)).ok());
  ASSERT_TRUE(conn->LoadTableRowwise("ints", TabularData::FromTable(source)).ok());
  EXPECT_EQ(3, client->NumberOfLoadCalls());
  EXPECT_EQ(60, (*client->GetTable("ints"))->num_rows());
}


TEST(LoadPipelineConfig, DefaultsFromConfiguration) {
  Configuration config(default_config_string);
  config.Append("tabxfer.load.method columnar");
  config.Append("tabxfer.load.chunk_size_bytes 1k");
  auto client = make_shared<LocalClient>(config);
  auto conn = Connection::Make(client, config);
  ASSERT_TRUE(conn.ok());

  auto st = (*conn)->LoadTable("readings", TabularData::FromTable(createReadingsTable(500)));
  ASSERT_TRUE(st.ok()) << st.ToString();
  EXPECT_GT(client->NumberOfLoadCalls(), 1);
}

TEST(LoadPipelineConfig, BadConfiguration) {
  auto client = make_shared<LocalClient>(Configuration(default_config_string));

  struct { string setting; ErrorCode code; } cases[] = {
    { "tabxfer.load.method bogus",             ErrorCode::InvalidMethod },
    { "tabxfer.load.create sometimes",         ErrorCode::InvalidOption },
    { "tabxfer.load.chunk_size_bytes -5",      ErrorCode::InvalidOption },
    { "tabxfer.load.chunk_size_bytes lots",    ErrorCode::InvalidOption },
    { "tabxfer.load.chunk_size_bytes 9000000000000g", ErrorCode::InvalidOption },
    { "tabxfer.fetch.transport carrier-pigeon", ErrorCode::InvalidOption },
    { "tabxfer.fetch.release_memory perhaps",  ErrorCode::InvalidOption },
  };
  for(auto &c : cases) {
    Configuration config(default_config_string);
    config.Append(c.setting);
    auto conn = Connection::Make(client, config);
    EXPECT_TRUE(IsError(conn.status(), c.code)) << c.setting;
  }

  //A connection built directly refuses every call
  Configuration config(default_config_string);
  config.Append("tabxfer.load.method bogus");
  Connection direct(client, config);
  EXPECT_TRUE(IsError(direct.GetTables().status(), ErrorCode::InvalidMethod));
  EXPECT_TRUE(IsError(direct.LoadTable("t", TabularData::FromTable(createIntTable(1, 1))), ErrorCode::InvalidMethod));
}
