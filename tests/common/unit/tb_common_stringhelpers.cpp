// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.


#include <string>

#include "gtest/gtest.h"

#include "tabxfer-common/StringHelpers.hh"

using namespace std;
using namespace tabxfer;

TEST(StringHelpers, SplitBasic) {
  string s1="this,is,c,s,v,data";
  vector<string> tokens;
  Split(tokens, s1, ',',false);
  EXPECT_EQ(6,tokens.size());
  EXPECT_EQ("this", tokens[0]);
  EXPECT_EQ("is",   tokens[1]);
  EXPECT_EQ("c",    tokens[2]);
  EXPECT_EQ("s",    tokens[3]);
  EXPECT_EQ("v",    tokens[4]);
  EXPECT_EQ("data", tokens[5]);

  string s2="this,,has,some,,missing,data,";
  vector<string> t2;
  Split(t2, s2, ',', false);
  EXPECT_EQ(8, t2.size());
  EXPECT_EQ("", t2[1]);
  EXPECT_EQ("some", t2[3]);
  EXPECT_EQ("data",t2[6]);
  EXPECT_EQ("", t2[7]);

  vector<string> t3;
  Split(t3, s2, ',', true); //Remove gaps
  EXPECT_EQ(5, t3.size());
  EXPECT_EQ("this",    t3[0]);
  EXPECT_EQ("has",     t3[1]);
  EXPECT_EQ("some",    t3[2]);
  EXPECT_EQ("missing", t3[3]);
  EXPECT_EQ("data",    t3[4]);

}

TEST(StringHelpers, ToLowerUpper) {
  string s="ThIs Is LoWeR 123";
  EXPECT_EQ("this is lower 123", ToLowercase(s));
}

TEST(StringHelpers, EndsWith) {
  string suffix = ".exe";
  string good[] = {"file.exe", "This is a big test.exe", ".exe"};
  string bad[] = {"X", "exe", ".EXE", "", "Thiz is file.Exe" };

  for(auto s : good) {
    bool hit = StringEndsWith(s, suffix);
    EXPECT_TRUE(hit);
  }

  for(auto s : bad) {
    bool hit = StringEndsWith(s, suffix);
    EXPECT_FALSE(hit);
  }
}


TEST(StringHelpers, Join) {
  EXPECT_EQ("a;b;c", Join({"a","b","c"}, ';'));
  EXPECT_EQ("solo",  Join({"solo"}, ' '));
  EXPECT_EQ("",      Join({}, ','));

  //Join undoes a Split that keeps empty fields
  string s = "x,,y,";
  EXPECT_EQ(s, Join(Split(s, ',', false), ','));
}

TEST(StringHelpers, ExpandPathSafely) {
    char *penv = getenv("HOME");
    EXPECT_TRUE(penv!=nullptr);

    string s1("~");
    string expanded1 = ExpandPathSafely(s1);
    EXPECT_EQ(penv, expanded1);

    string s2("$(echo ~)");
    string expanded2 = ExpandPathSafely(s2);
    EXPECT_EQ("", expanded2);

    string s3("$HOME");
    string expanded3 = ExpandPathSafely(s3);
    EXPECT_EQ(penv, expanded3);

    string s4("$NOT_DEFINED_ANYWHERE_TABXFER");
    EXPECT_EQ("", ExpandPathSafely(s4));
}

TEST(StringToNum, Int64) {
  int rc;
  int64_t val=0;

  //Good
  rc = StringToInt64(&val, "9");    EXPECT_EQ(0,rc); EXPECT_EQ(9, val);
  rc = StringToInt64(&val, "-12");  EXPECT_EQ(0,rc); EXPECT_EQ(-12, val);
  rc = StringToInt64(&val, "4k");   EXPECT_EQ(0,rc); EXPECT_EQ(4096, val);
  rc = StringToInt64(&val, "3M");   EXPECT_EQ(0,rc); EXPECT_EQ(3*1024*1024, val);
  rc = StringToInt64(&val, "2g");   EXPECT_EQ(0,rc); EXPECT_EQ(2LL*1024*1024*1024, val);

  //Bad
  val=7;
  rc = StringToInt64(&val, "");     EXPECT_EQ(EINVAL,rc); EXPECT_EQ(7, val);
  rc = StringToInt64(&val, "k");    EXPECT_EQ(EINVAL,rc); EXPECT_EQ(7, val);
  rc = StringToInt64(&val, "12x");  EXPECT_EQ(EINVAL,rc); EXPECT_EQ(7, val);
  rc = StringToInt64(&val, "1.5k"); EXPECT_EQ(EINVAL,rc); EXPECT_EQ(7, val);
  rc = StringToInt64(&val, "\xe9");  EXPECT_EQ(EINVAL,rc); EXPECT_EQ(7, val);

  //Suffix pushes the value past 64 bits
  rc = StringToInt64(&val, "9000000000000g");  EXPECT_EQ(EINVAL,rc); EXPECT_EQ(7, val);
  rc = StringToInt64(&val, "-9000000000000g"); EXPECT_EQ(EINVAL,rc); EXPECT_EQ(7, val);
  rc = StringToInt64(&val, "8589934591g");     EXPECT_EQ(0,rc); EXPECT_EQ(8589934591LL*1024*1024*1024, val);
}

TEST(StringToNum, Boolean) {
  bool b=false;
  EXPECT_EQ(0, StringToBoolean(&b, "TRUE")); EXPECT_TRUE(b);
  EXPECT_EQ(0, StringToBoolean(&b, "off"));  EXPECT_FALSE(b);
  EXPECT_EQ(0, StringToBoolean(&b, "1"));    EXPECT_TRUE(b);
  EXPECT_EQ(EINVAL, StringToBoolean(&b, "infer"));
}
