#include "qdag_test_utils.hpp"

// Register QdagEnvironment so codecs are initialized before any test runs.
// gtest_main provides main(), so we use a static-init trick.
static auto *const kQdagEnv =
    ::testing::AddGlobalTestEnvironment(new qdag::testing::QdagEnvironment);
