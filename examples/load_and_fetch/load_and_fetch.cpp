// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

// Load and Fetch Example
//
// A Connection moves tables to and from a database session. This example
// runs against LocalClient, an in-process server, so it needs no database.
// It walks through the two halves of the library:
//
//  1. Loads: an Arrow table is loaded three ways. The first load creates
//     the table and lets the connection pick the method. The second
//     forces the columnar method with a small chunk size, so the rows go
//     over in several batches. The third appends plain rows.
//  2. Fetches: the table is read back through a shared memory segment and
//     through the wire. Each fetched table is released when we're done
//     with it, which frees the server's copy of the result.
//
// Try setting tabxfer.debug to true in the configuration to see each step.

#include <iostream>

#include <arrow/api.h>

#include "tabxfer-common/Common.hh"
#include "tabxfer-client/Connection.hh"
#include "tabxfer-client/LocalClient.hh"

//The configuration used in this example
std::string default_config_string = R"EOF(

# Columnar loads get split into batches of about this many bytes
tabxfer.load.chunk_size_bytes   4k

# Fetch through shared memory unless told otherwise
tabxfer.fetch.transport         shared_memory

# Uncomment these options to get debug info for each component
#tabxfer.debug         true
#tabxfer.fetch.debug   true
#tabxfer.release.debug true
#localclient.debug     true
)EOF";

using namespace std;

//Build a table of sensor readings: id, temperature, and site
shared_ptr<arrow::Table> makeReadings(int num_rows, int first_id) {
  const char *sites[] = { "alpha", "bravo", "charlie" };
  arrow::Int64Builder id_builder;
  arrow::DoubleBuilder temp_builder;
  arrow::StringBuilder site_builder;

  arrow::Status st;
  for(int i=0; (i<num_rows) && st.ok(); i++) {
    st = id_builder.Append(first_id+i);
    if(st.ok()) st = (i%7==3) ? temp_builder.AppendNull() : temp_builder.Append(20.0 + 0.25*i);
    if(st.ok()) st = site_builder.Append(sites[i%3]);
  }
  shared_ptr<arrow::Array> ids, temps, site_names;
  if(st.ok()) st = id_builder.Finish(&ids);
  if(st.ok()) st = temp_builder.Finish(&temps);
  if(st.ok()) st = site_builder.Finish(&site_names);
  if(!st.ok()) {
    cerr << "Could not build readings: " << st.ToString() << endl;
    return nullptr;
  }

  auto schema = arrow::schema({arrow::field("id", arrow::int64()),
                               arrow::field("temperature", arrow::float64()),
                               arrow::field("site", arrow::utf8())});
  return arrow::Table::Make(schema, {ids, temps, site_names});
}

//Bail out of main if a step fails
#define CHECK(expr) \
  do { auto _st = (expr); if(!_st.ok()) { cerr << #expr << " failed: " << _st.ToString() << endl; return 1; } } while(0)

int main() {

  tabxfer::Configuration config(default_config_string);
  auto client = make_shared<tabxfer::LocalClient>(config);
  auto conn_result = tabxfer::Connection::Make(client, config);
  if(!conn_result.ok()) {
    cerr << "Bad configuration: " << conn_result.status().ToString() << endl;
    return 1;
  }
  auto conn = *conn_result;

  //Load 1: table doesn't exist yet, so it is created and the method is inferred
  auto first = makeReadings(100, 0);
  if(!first) return 1;
  CHECK(conn->LoadTable("readings", tabxfer::TabularData::FromTable(first)));

  //Load 2: force the columnar path. The 4k budget splits this into batches
  tabxfer::LoadOptions columnar;
  columnar.method = "columnar";
  auto second = makeReadings(1000, 100);
  if(!second) return 1;
  CHECK(conn->LoadTable("readings", tabxfer::TabularData::FromTable(second), columnar));
  cout << "Columnar load took " << client->GetLoadCallRows().size()-1 << " batches" << endl;

  //Load 3: a few rows built by hand
  tabxfer::RowSet rows;
  rows.push_back({arrow::MakeScalar(int64_t(5000)), arrow::MakeScalar(18.5),         arrow::MakeScalar(string("delta"))});
  rows.push_back({arrow::MakeScalar(int64_t(5001)), arrow::MakeNullScalar(arrow::float64()), arrow::MakeScalar(string("echo"))});
  CHECK(conn->LoadTable("readings", tabxfer::TabularData::FromRows(rows, {"id", "temperature", "site"})));

  auto details = conn->GetTableDetails("readings");
  CHECK(details.status());
  cout << "Table readings:" << endl;
  for(auto &spec : *details)
    cout << "  " << spec.str() << endl;

  //Fetch through shared memory, then release the server's copy
  auto shm_table = conn->SelectIpc("SELECT * FROM readings");
  CHECK(shm_table.status());
  cout << "Shared memory fetch: " << (*shm_table)->num_rows() << " rows" << endl;
  cout << conn->str(1);
  CHECK(conn->Release(*shm_table));

  //Fetch the first few rows over the wire, releasing as part of the fetch
  auto opts = conn->DefaultFetchOptions();
  opts.transport = tabxfer::TransportMode::Inline;
  opts.first_n = 5;
  opts.release_memory = true;
  auto wire_table = conn->SelectIpc("SELECT * FROM readings", opts);
  CHECK(wire_table.status());
  cout << "Wire fetch of the first " << opts.first_n << " rows:" << endl
       << (*wire_table)->ToString() << endl;

  //A second release is refused
  auto st = conn->Release(*wire_table);
  cout << "Releasing again: " << tabxfer::to_string(tabxfer::GetErrorCode(st)) << endl;

  cout << "Open server results: " << client->NumberOfOpenResults() << endl;
  return 0;
}
