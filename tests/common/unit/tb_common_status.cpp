// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.


#include <string>

#include "gtest/gtest.h"

#include "tabxfer-common/Status.hh"

using namespace std;
using namespace tabxfer;


TEST(Status, MakeErrorCarriesDetail) {
  auto s = MakeError(ErrorCode::SchemaMismatch, "table has 3 columns, source has 2", Phase::Load);
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(ErrorCode::SchemaMismatch, GetErrorCode(s));
  EXPECT_EQ(Phase::Load, GetPhase(s));
  EXPECT_TRUE(IsError(s, ErrorCode::SchemaMismatch));
  EXPECT_FALSE(IsError(s, ErrorCode::TypeMismatch));
  EXPECT_EQ("table has 3 columns, source has 2", s.message());

  //Phase defaults to none
  auto s2 = MakeError(ErrorCode::InvalidMethod, "bad method");
  EXPECT_EQ(Phase::None, GetPhase(s2));
}

TEST(Status, ArrowCodes) {
  EXPECT_TRUE(MakeError(ErrorCode::TypeMismatch, "x").IsTypeError());
  EXPECT_TRUE(MakeError(ErrorCode::UnsupportedTransport, "x").IsNotImplemented());
  EXPECT_TRUE(MakeError(ErrorCode::NoDescriptor, "x").IsKeyError());
  EXPECT_TRUE(MakeError(ErrorCode::TransportFailure, "x").IsIOError());
  EXPECT_TRUE(MakeError(ErrorCode::SchemaMismatch, "x").IsInvalid());
  EXPECT_TRUE(MakeError(ErrorCode::AlreadyReleased, "x").IsInvalid());
}

TEST(Status, PlainArrowStatus) {
  EXPECT_EQ(ErrorCode::None, GetErrorCode(arrow::Status::OK()));
  EXPECT_EQ(Phase::None, GetPhase(arrow::Status::OK()));
  EXPECT_FALSE(IsError(arrow::Status::OK(), ErrorCode::None));

  auto s = arrow::Status::IOError("connection reset");
  EXPECT_EQ(ErrorCode::None, GetErrorCode(s));
  EXPECT_EQ(Phase::None, GetPhase(s));
}

TEST(Status, TagPhase) {
  //Ok passes through
  EXPECT_TRUE(TagPhase(arrow::Status::OK(), Phase::Fetch).ok());

  //Plain arrow errors came from the rpc layer
  auto s1 = TagPhase(arrow::Status::IOError("connection reset"), Phase::Fetch);
  EXPECT_TRUE(s1.IsIOError());
  EXPECT_EQ("connection reset", s1.message());
  EXPECT_EQ(ErrorCode::TransportFailure, GetErrorCode(s1));
  EXPECT_EQ(Phase::Fetch, GetPhase(s1));

  //Existing codes are kept
  auto s2 = TagPhase(MakeError(ErrorCode::TableExists, "exists"), Phase::Create);
  EXPECT_EQ(ErrorCode::TableExists, GetErrorCode(s2));
  EXPECT_EQ(Phase::Create, GetPhase(s2));
  EXPECT_EQ("exists", s2.message());
}

TEST(Status, Strings) {
  EXPECT_EQ("AlreadyReleased", to_string(ErrorCode::AlreadyReleased));
  EXPECT_EQ("UnsupportedTransport", to_string(ErrorCode::UnsupportedTransport));
  EXPECT_EQ("Release", to_string(Phase::Release));

  ErrorDetail d1(ErrorCode::NoDescriptor, Phase::None);
  EXPECT_EQ("NoDescriptor", d1.ToString());
  ErrorDetail d2(ErrorCode::NoDescriptor, Phase::Release);
  EXPECT_EQ("NoDescriptor during Release", d2.ToString());

  auto s = MakeError(ErrorCode::TypeMismatch, "column 'a'", Phase::Load);
  EXPECT_NE(string::npos, s.ToString().find("column 'a'"));
}
