// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "account.h"
#include "streams.h"
#include "test/test_crowdfund.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(account_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(account_null)
{
    CAccountID id;
    BOOST_CHECK(id.IsNull());
    BOOST_CHECK_EQUAL(id.ToString(), "0x0000000000000000000000000000000000000000");

    CAccountID a = TestAccount(0xab);
    BOOST_CHECK(!a.IsNull());
    a.SetNull();
    BOOST_CHECK(a.IsNull());
    BOOST_CHECK(a == id);
}

BOOST_AUTO_TEST_CASE(account_hex)
{
    CAccountID id;
    BOOST_CHECK(ParseAccountID("0x00000000000000000000000000000000000000Ff", id));
    BOOST_CHECK_EQUAL(id.GetHex(), "0x00000000000000000000000000000000000000ff");

    // Prefix is optional
    CAccountID id2;
    BOOST_CHECK(ParseAccountID("00000000000000000000000000000000000000ff", id2));
    BOOST_CHECK(id == id2);

    BOOST_CHECK_EQUAL(TestAccount(0x11).GetHex(), "0x1111111111111111111111111111111111111111");
}

BOOST_AUTO_TEST_CASE(account_hex_rejects)
{
    const CAccountID before = TestAccount(0x22);
    CAccountID id = before;

    BOOST_CHECK(!id.SetHex(""));
    BOOST_CHECK(!id.SetHex("0x"));
    BOOST_CHECK(!id.SetHex("0x11"));                                           // too short
    BOOST_CHECK(!id.SetHex("0x111111111111111111111111111111111111111111"));   // too long
    BOOST_CHECK(!id.SetHex("0x111111111111111111111111111111111111111g"));     // bad digit

    // Untouched on error
    BOOST_CHECK(id == before);
}

BOOST_AUTO_TEST_CASE(account_ordering)
{
    BOOST_CHECK(TestAccount(1) < TestAccount(2));
    BOOST_CHECK(!(TestAccount(2) < TestAccount(1)));
    BOOST_CHECK(TestAccount(3) != TestAccount(4));
}

BOOST_AUTO_TEST_CASE(account_serialize)
{
    CDataStream ss;
    ss << TestAccount(0x5a);
    BOOST_CHECK_EQUAL(ss.size(), CAccountID::WIDTH);

    CAccountID id;
    ss >> id;
    BOOST_CHECK(id == TestAccount(0x5a));
}

BOOST_AUTO_TEST_SUITE_END()
