// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <credit/authorization.h>
#include <test/test_credit.h>

#include <boost/test/unit_test.hpp>

using namespace credit;

BOOST_FIXTURE_TEST_SUITE(credit_authorization_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(admin_holds_admin_capability)
{
    Principal admin = InsecureRand160();
    AuthorizationGate gate(admin);

    BOOST_CHECK(gate.IsAllowed(Capability::ADMIN, admin));
    BOOST_CHECK(!gate.IsAllowed(Capability::LEDGER_WRITER, admin));
    BOOST_CHECK_EQUAL(gate.CountHolders(Capability::ADMIN), 1U);
    BOOST_CHECK_EQUAL(gate.CountHolders(Capability::ATTESTER), 0U);
}

BOOST_AUTO_TEST_CASE(grant_and_revoke)
{
    Principal admin = InsecureRand160();
    Principal writer = InsecureRand160();
    AuthorizationGate gate(admin);

    BOOST_CHECK(gate.Require(Capability::LEDGER_WRITER, writer).error == CreditError::UNAUTHORIZED);

    BOOST_CHECK(gate.Grant(admin, Capability::LEDGER_WRITER, writer).IsOk());
    BOOST_CHECK(gate.IsAllowed(Capability::LEDGER_WRITER, writer));
    BOOST_CHECK(gate.Require(Capability::LEDGER_WRITER, writer).IsOk());

    // Granting twice is idempotent
    BOOST_CHECK(gate.Grant(admin, Capability::LEDGER_WRITER, writer).IsOk());
    BOOST_CHECK_EQUAL(gate.CountHolders(Capability::LEDGER_WRITER), 1U);

    BOOST_CHECK(gate.Revoke(admin, Capability::LEDGER_WRITER, writer).IsOk());
    BOOST_CHECK(!gate.IsAllowed(Capability::LEDGER_WRITER, writer));

    // Revoking an absent holder is a no-op
    BOOST_CHECK(gate.Revoke(admin, Capability::LEDGER_WRITER, writer).IsOk());
}

BOOST_AUTO_TEST_CASE(non_admin_cannot_change_lists)
{
    Principal admin = InsecureRand160();
    Principal outsider = InsecureRand160();
    AuthorizationGate gate(admin);

    CreditResult result = gate.Grant(outsider, Capability::ADMIN, outsider);
    BOOST_CHECK_EQUAL(result.error, CreditError::UNAUTHORIZED);
    BOOST_CHECK(!gate.IsAllowed(Capability::ADMIN, outsider));

    BOOST_CHECK(gate.Grant(admin, Capability::ATTESTER, outsider).IsOk());
    result = gate.Revoke(outsider, Capability::ATTESTER, outsider);
    BOOST_CHECK_EQUAL(result.error, CreditError::UNAUTHORIZED);
    BOOST_CHECK(gate.IsAllowed(Capability::ATTESTER, outsider));
}

BOOST_AUTO_TEST_CASE(null_principal_rejected)
{
    Principal admin = InsecureRand160();
    AuthorizationGate gate(admin);

    CreditResult result = gate.Grant(admin, Capability::FUND_COVERER, Principal());
    BOOST_CHECK(!result.IsOk());
    BOOST_CHECK_EQUAL(gate.CountHolders(Capability::FUND_COVERER), 0U);
}

BOOST_AUTO_TEST_CASE(last_admin_cannot_be_revoked)
{
    Principal admin = InsecureRand160();
    Principal second = InsecureRand160();
    AuthorizationGate gate(admin);

    BOOST_CHECK_EQUAL(gate.Revoke(admin, Capability::ADMIN, admin).error, CreditError::UNAUTHORIZED);
    BOOST_CHECK(gate.IsAllowed(Capability::ADMIN, admin));

    BOOST_CHECK(gate.Grant(admin, Capability::ADMIN, second).IsOk());
    BOOST_CHECK(gate.Revoke(second, Capability::ADMIN, admin).IsOk());
    BOOST_CHECK(!gate.IsAllowed(Capability::ADMIN, admin));
    BOOST_CHECK(gate.IsAllowed(Capability::ADMIN, second));
}

BOOST_AUTO_TEST_CASE(capability_names)
{
    BOOST_CHECK_EQUAL(CapabilityToString(Capability::LEDGER_WRITER), "ledger_writer");
    BOOST_CHECK_EQUAL(CapabilityToString(Capability::ADMIN), "admin");
    BOOST_CHECK_EQUAL(CreditErrorToString(CreditError::EXCEEDS_ALLOWED_LTV), "ExceedsAllowedLTV");
}

BOOST_AUTO_TEST_SUITE_END()
