#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::utils::test {
//---------------------------------------------------------------------------
TEST_CASE("data_vector") {
    DataVector<uint64_t> dv;
    REQUIRE(dv.empty());
    dv.reserve(1);
    REQUIRE(dv.size() == 0);
    dv.resize(1);
    *dv.data() = 42;
    REQUIRE(*dv.cdata() == 42);
    REQUIRE(dv.capacity() == 1);

    SECTION("append grows and keeps content") {
        uint64_t values[] = {43, 44, 45};
        dv.append(values, 3);
        REQUIRE(dv.size() == 4);
        REQUIRE(dv.capacity() >= 4);
        REQUIRE(dv.cdata()[0] == 42);
        REQUIRE(dv.cdata()[3] == 45);
    }
    SECTION("consume moves the remainder to the front") {
        uint64_t values[] = {43, 44};
        dv.append(values, 2);
        dv.consume(2);
        REQUIRE(dv.size() == 1);
        REQUIRE(dv.cdata()[0] == 44);
        dv.consume(1);
        REQUIRE(dv.empty());
    }
    SECTION("consume past the end") {
        REQUIRE_THROWS_AS(dv.consume(2), std::runtime_error);
    }
}
//---------------------------------------------------------------------------
} // namespace dumpsync::utils::test
