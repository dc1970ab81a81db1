#include "player_uuid/OfflineUuid.h"
#include "player_uuid/PlayerUuid.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <sstream>
#include <stdexcept>
#include <string>

#define CUT_TAG "[mcuuid::player_uuid::PlayerUuid]"
#define DEFINE_TEST(name) CATCH_TEST_CASE(CUT_TAG " " name, CUT_TAG)

using mcuuid::player_uuid::PlayerUuid;
using mcuuid::player_uuid::Provenance;
using mcuuid::utils::parse_uuid;

DEFINE_TEST("offline players carry the derived identifier") {
    const auto player = PlayerUuid::from_offline_username("Notch");

    CATCH_CHECK(player.provenance() == Provenance::Offline);
    CATCH_CHECK(player.is_offline());
    CATCH_CHECK_FALSE(player.is_online());
    CATCH_CHECK(player.to_canonical_string() == "b50ad385-829d-3141-a216-7e7d7539ba7f");
    CATCH_CHECK(player.uuid() == mcuuid::player_uuid::derive_offline_uuid("Notch"));
    CATCH_CHECK(player.as_bytes() == player.uuid().bytes());
}

DEFINE_TEST("online players keep the identifier they were given") {
    const auto uuid = parse_uuid("069a79f444e94726a5befca90e38aaf5");
    const PlayerUuid player(uuid, Provenance::Online);

    CATCH_CHECK(player.provenance() == Provenance::Online);
    CATCH_CHECK(player.is_online());
    CATCH_CHECK(player.to_canonical_string() == "069a79f4-44e9-4726-a5be-fca90e38aaf5");
    CATCH_CHECK(player.as_bytes() == uuid.bytes());
}

DEFINE_TEST("from_uuid infers provenance from the version") {
    CATCH_SECTION("version 4 is online") {
        const auto player =
                PlayerUuid::from_uuid(parse_uuid("61699b2e-d327-4a01-9f1e-0ea8c3f06bc6"));
        CATCH_CHECK(player.provenance() == Provenance::Online);
    }

    CATCH_SECTION("version 3 is offline") {
        const auto player =
                PlayerUuid::from_uuid(parse_uuid("db62bdfb-eddc-3acc-a14e-c703aba52549"));
        CATCH_CHECK(player.provenance() == Provenance::Offline);
        CATCH_CHECK(player == PlayerUuid::from_offline_username("boolean_coercion"));
    }

    CATCH_SECTION("other versions are rejected") {
        auto text = GENERATE("00000000-0000-0000-0000-000000000000",
                             "c232ab00-9414-11ec-b3c8-9f6bdeced846",
                             "886313e1-3b8a-5372-9b90-0c9aee199e5d",
                             "017f22e2-79b0-7cc3-98c4-dc0c0c07398f");
        CATCH_CAPTURE(text);
        CATCH_CHECK_THROWS_AS(PlayerUuid::from_uuid(parse_uuid(text)), std::invalid_argument);
    }
}

DEFINE_TEST("equality takes provenance into account") {
    const auto uuid = parse_uuid("069a79f4-44e9-4726-a5be-fca90e38aaf5");
    const PlayerUuid online(uuid, Provenance::Online);
    const PlayerUuid offline(uuid, Provenance::Offline);

    CATCH_CHECK(online == PlayerUuid(uuid, Provenance::Online));
    CATCH_CHECK(online != offline);
    CATCH_CHECK(offline < online);
}

DEFINE_TEST("string forms") {
    CATCH_CHECK(mcuuid::player_uuid::to_string(Provenance::Offline) == "offline");
    CATCH_CHECK(mcuuid::player_uuid::to_string(Provenance::Online) == "online");

    std::ostringstream os;
    os << PlayerUuid::from_offline_username("jeb_");
    CATCH_CHECK(os.str() == "a762f560-4fce-3236-812a-b80efff0b62b (offline)");
}
