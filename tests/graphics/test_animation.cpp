/*
 * Stagecraft Animation Tests
 *
 * Frame stepping is driven through the explicit-time variants so results
 * do not depend on the wall clock.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "stagecraft/animation.h"

using Catch::Approx;

TEST_CASE("Animation defaults", "[animation][lifecycle]") {
    Stagecraft_Animation anim = STAGECRAFT_ANIMATION_DEFAULT;
    REQUIRE_FALSE(stagecraft_animation_is_running(&anim));
    REQUIRE(anim.image_index == 0);
    REQUIRE(anim.frame_time_s == Approx(0.1));

    /* Not started: updates do nothing */
    stagecraft_animation_update_at(&anim, 3, 10.0);
    REQUIRE(anim.image_index == 0);
}

TEST_CASE("Looping animation", "[animation][loop]") {
    Stagecraft_Animation anim = STAGECRAFT_ANIMATION_DEFAULT;
    stagecraft_animation_start_at(&anim, true, 0, 0.1, 0.0);
    REQUIRE(stagecraft_animation_is_running(&anim));

    SECTION("Holds until the frame time passes") {
        stagecraft_animation_update_at(&anim, 3, 0.05);
        REQUIRE(anim.image_index == 0);
        stagecraft_animation_update_at(&anim, 3, 0.1);
        REQUIRE(anim.image_index == 0);
    }

    SECTION("Advances and wraps") {
        stagecraft_animation_update_at(&anim, 3, 0.11);
        REQUIRE(anim.image_index == 1);
        stagecraft_animation_update_at(&anim, 3, 0.21);
        REQUIRE(anim.image_index == 2);
        stagecraft_animation_update_at(&anim, 3, 0.32);
        REQUIRE(anim.image_index == 0);
        REQUIRE(stagecraft_animation_is_running(&anim));
    }

    SECTION("Time base steps by one frame") {
        stagecraft_animation_update_at(&anim, 3, 0.15);
        REQUIRE(anim.last_frame_time == Approx(0.1));
    }

    SECTION("Sparse updates resync instead of bursting") {
        stagecraft_animation_update_at(&anim, 3, 1.0);
        REQUIRE(anim.image_index == 1);
        REQUIRE(anim.last_frame_time == Approx(1.0));

        stagecraft_animation_update_at(&anim, 3, 1.05);
        REQUIRE(anim.image_index == 1);
    }

    SECTION("Stop freezes the frame") {
        stagecraft_animation_update_at(&anim, 3, 0.11);
        stagecraft_animation_stop(&anim);
        stagecraft_animation_update_at(&anim, 3, 5.0);
        REQUIRE(anim.image_index == 1);
        REQUIRE_FALSE(stagecraft_animation_is_running(&anim));
    }

    SECTION("No frames is a no-op") {
        stagecraft_animation_update_at(&anim, 0, 5.0);
        REQUIRE(anim.image_index == 0);
    }
}

TEST_CASE("One-shot animation", "[animation][once]") {
    Stagecraft_Animation anim = STAGECRAFT_ANIMATION_DEFAULT;
    stagecraft_animation_start_at(&anim, false, 0, 0.1, 0.0);

    stagecraft_animation_update_at(&anim, 3, 0.11);
    REQUIRE(anim.image_index == 1);
    REQUIRE(stagecraft_animation_is_running(&anim));

    stagecraft_animation_update_at(&anim, 3, 0.22);
    REQUIRE(anim.image_index == 2);
    REQUIRE_FALSE(stagecraft_animation_is_running(&anim));

    /* Holds the last frame */
    stagecraft_animation_update_at(&anim, 3, 1.0);
    REQUIRE(anim.image_index == 2);
}

TEST_CASE("Animation start index", "[animation][start]") {
    Stagecraft_Animation anim = STAGECRAFT_ANIMATION_DEFAULT;

    stagecraft_animation_start_at(&anim, true, 2, 0.5, 0.0);
    REQUIRE(anim.image_index == 2);
    REQUIRE(anim.frame_time_s == Approx(0.5));

    stagecraft_animation_start_at(&anim, true, -4, 0.5, 0.0);
    REQUIRE(anim.image_index == 0);

    stagecraft_animation_start(&anim, true, 1, 0.25);
    REQUIRE(anim.image_index == 1);
    REQUIRE(stagecraft_animation_is_running(&anim));
}
