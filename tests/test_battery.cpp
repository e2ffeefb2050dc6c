#include <catch2/catch_test_macros.hpp>
#include "swarmsearch/core/battery.hpp"

using namespace swarmsearch::core;

TEST_CASE("Battery drain", "[battery]") {
    BatteryParams params;

    SECTION("Each battery draws its own rate from the configured band") {
        for (uint64_t seed = 0; seed < 20; ++seed) {
            Battery battery(params, seed);
            REQUIRE(battery.drain_rate() >= params.min_drain);
            REQUIRE(battery.drain_rate() <= params.max_drain);
            REQUIRE(battery.charge() == params.capacity);
        }
    }

    SECTION("Same seed, same battery") {
        Battery a(params, 5);
        Battery b(params, 5);
        for (int i = 0; i < 30; ++i) {
            a.draw();
            b.draw();
        }
        REQUIRE(a.drain_rate() == b.drain_rate());
        REQUIRE(a.charge() == b.charge());
    }

    SECTION("A move costs the rate within the jitter band") {
        Battery battery(params, 11);
        const double before = battery.charge();
        REQUIRE(battery.draw());
        const double spent = before - battery.charge();
        REQUIRE(spent >= battery.drain_rate() * (1.0 - params.drain_jitter));
        REQUIRE(spent <= battery.drain_rate() * (1.0 + params.drain_jitter));
    }

    SECTION("Charge never goes below zero") {
        params.capacity = 1.0;
        Battery battery(params, 2);
        int moves = 0;
        while (battery.draw()) {
            ++moves;
        }
        REQUIRE(battery.depleted());
        REQUIRE(battery.charge() == 0.0);
        REQUIRE(moves >= 7);
        REQUIRE(moves <= 13);
        REQUIRE(!battery.draw());
    }
}

TEST_CASE("Battery dropouts", "[battery]") {
    BatteryParams params;
    params.dropout_probability = 1.0;

    SECTION("A healthy battery always transmits") {
        Battery battery(params, 1);
        REQUIRE(!battery.low());
        for (int i = 0; i < 20; ++i) {
            REQUIRE(battery.transmits());
        }
    }

    SECTION("A low battery drops with the configured probability") {
        params.capacity = 10.0;
        Battery certain(params, 1);
        REQUIRE(certain.low());
        REQUIRE(!certain.transmits());

        params.dropout_probability = 0.0;
        Battery never(params, 1);
        REQUIRE(never.transmits());
    }

    SECTION("Roughly the configured share is lost") {
        params.capacity = 10.0;
        params.dropout_probability = 0.3;
        Battery battery(params, 17);

        int lost = 0;
        for (int i = 0; i < 1000; ++i) {
            if (!battery.transmits()) {
                ++lost;
            }
        }
        INFO("lost " << lost << " of 1000");
        REQUIRE(lost > 220);
        REQUIRE(lost < 380);
    }
}
