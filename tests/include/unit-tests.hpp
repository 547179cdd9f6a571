#pragma once

#include <gtest/gtest.h>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <spdlog/spdlog.h>

#include "aptos_json.hpp"

namespace aptos::tests
{
    class UnitTest : public ::testing::Test
    {
        protected:
            void SetUp() override
            {
                spdlog::set_level(spdlog::level::debug);
            }

            void TearDown() override
            {
                spdlog::set_level(spdlog::level::info);
            }
    };
}
