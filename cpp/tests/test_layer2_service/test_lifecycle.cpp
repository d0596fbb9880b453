// tests/test_layer2_service/test_lifecycle.cpp
/**
 * @file test_lifecycle.cpp
 * @brief LifecycleManager and ModuleDef behaviour once the process lifecycle is up.
 *
 * The test entry point already owns the process lifecycle, so the first tests observe
 * its initialized state. Ordering, validation, rollback and shutdown deadlines are
 * exercised on standalone managers.
 */
#include "wk_service.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <initializer_list>
#include <mutex>
#include <source_location>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace walkie::utils;

TEST(LifecycleTest, AppIsInitializedByTestEnvironment)
{
    EXPECT_TRUE(IsAppInitialized());
    EXPECT_FALSE(IsAppFinalized());
}

TEST(LifecycleTest, RegisteredModulesAreStarted)
{
    EXPECT_TRUE(IsModuleStarted("walkie::utils::Logger"));
    EXPECT_TRUE(IsModuleStarted("walkie::utils::FileLock"));
    EXPECT_TRUE(IsModuleStarted("CryptoUtils"));
    EXPECT_TRUE(IsModuleStarted("ZMQContext"));
    EXPECT_FALSE(IsModuleStarted("NoSuchModule"));
}

TEST(LifecycleTest, ModuleFlagsReflectStartup)
{
    EXPECT_TRUE(Logger::lifecycle_initialized());
    EXPECT_TRUE(FileLock::lifecycle_initialized());
    EXPECT_TRUE(zmq_context_available());
}

TEST(LifecycleTest, SecondGuardIsNotOwner)
{
    LifecycleGuard second(Logger::GetLifecycleModule());
    EXPECT_FALSE(second.is_owner());
    EXPECT_TRUE(IsAppInitialized());
}

TEST(LifecycleTest, RegisterAfterInitializeThrows)
{
    ModuleDef late("LateModule");
    EXPECT_THROW(RegisterModule(std::move(late)), std::logic_error);
}

TEST(LifecycleTest, ModuleNameValidation)
{
    EXPECT_THROW(ModuleDef(""), std::invalid_argument);
    EXPECT_THROW(ModuleDef(std::string(ModuleDef::MAX_MODULE_NAME_LEN + 1, 'm')),
                 std::length_error);
    EXPECT_NO_THROW(ModuleDef(std::string(ModuleDef::MAX_MODULE_NAME_LEN, 'm')));

    ModuleDef def("Valid");
    EXPECT_THROW(def.add_dependency(std::string(ModuleDef::MAX_MODULE_NAME_LEN + 1, 'd')),
                 std::length_error);
    EXPECT_NO_THROW(def.add_dependency(""));
}

// ============================================================================
// Standalone managers: ordering, validation, rollback and shutdown timeouts
// ============================================================================

namespace
{

std::mutex g_events_mutex;
std::vector<std::string> g_events;

void record(const char *event)
{
    std::lock_guard<std::mutex> lock(g_events_mutex);
    g_events.emplace_back(event);
}

std::vector<std::string> events()
{
    std::lock_guard<std::mutex> lock(g_events_mutex);
    return g_events;
}

ModuleDef make_module(const char *name, LifecycleCallback start, LifecycleCallback stop,
                      std::initializer_list<const char *> deps = {},
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(1000))
{
    ModuleDef def(name);
    for (const char *dep : deps)
        def.add_dependency(dep);
    def.set_startup(start);
    def.set_shutdown(stop, timeout);
    return def;
}

void start_a() { record("start A"); }
void stop_a() { record("stop A"); }
void start_b() { record("start B"); }
void stop_b() { record("stop B"); }
void start_c() { record("start C"); }
void stop_c() { record("stop C"); }
void start_b_throws() { throw std::runtime_error("no device"); }
void stop_slow()
{
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
}

class LifecycleManagerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        std::lock_guard<std::mutex> lock(g_events_mutex);
        g_events.clear();
    }

    void initialize() { m_manager.initialize(std::source_location::current()); }
    void finalize() { m_manager.finalize(std::source_location::current()); }

    LifecycleManager m_manager;
};

} // namespace

TEST_F(LifecycleManagerTest, StartsDependenciesFirstAndStopsInReverse)
{
    m_manager.register_module(make_module("C", &start_c, &stop_c, {"B"}));
    m_manager.register_module(make_module("B", &start_b, &stop_b, {"A"}));
    m_manager.register_module(make_module("A", &start_a, &stop_a));

    initialize();
    EXPECT_TRUE(m_manager.is_initialized());
    EXPECT_TRUE(m_manager.is_module_started("A"));
    EXPECT_TRUE(m_manager.is_module_started("C"));
    EXPECT_EQ(events(), (std::vector<std::string>{"start A", "start B", "start C"}));

    finalize();
    EXPECT_TRUE(m_manager.is_finalized());
    EXPECT_FALSE(m_manager.is_module_started("A"));
    EXPECT_EQ(events(), (std::vector<std::string>{"start A", "start B", "start C", "stop C",
                                                  "stop B", "stop A"}));

    // Both are one-shot.
    initialize();
    finalize();
    EXPECT_EQ(events().size(), 6u);
}

TEST_F(LifecycleManagerTest, FinalizeBeforeInitializeDoesNothing)
{
    m_manager.register_module(make_module("A", &start_a, &stop_a));
    finalize();
    EXPECT_FALSE(m_manager.is_finalized());
    EXPECT_TRUE(events().empty());
}

TEST_F(LifecycleManagerTest, RegisterAfterInitializeThrows)
{
    m_manager.register_module(make_module("A", &start_a, &stop_a));
    initialize();
    EXPECT_THROW(m_manager.register_module(make_module("B", &start_b, &stop_b)),
                 std::logic_error);
    finalize();
}

TEST_F(LifecycleManagerTest, DuplicateNameIsRejected)
{
    m_manager.register_module(make_module("A", &start_a, &stop_a));
    m_manager.register_module(make_module("A", &start_b, &stop_b));
    try
    {
        initialize();
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find("duplicate module name: A"), std::string::npos)
            << e.what();
    }
    EXPECT_TRUE(events().empty());
    EXPECT_TRUE(m_manager.is_finalized());
}

TEST_F(LifecycleManagerTest, UnknownDependencyIsRejected)
{
    m_manager.register_module(make_module("A", &start_a, &stop_a, {"Missing"}));
    try
    {
        initialize();
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find("unknown module 'Missing'"), std::string::npos)
            << e.what();
    }
    EXPECT_TRUE(events().empty());
}

TEST_F(LifecycleManagerTest, DependencyCycleIsRejectedWithPath)
{
    m_manager.register_module(make_module("A", &start_a, &stop_a, {"B"}));
    m_manager.register_module(make_module("B", &start_b, &stop_b, {"A"}));
    m_manager.register_module(make_module("C", &start_c, &stop_c));
    try
    {
        initialize();
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find("A -> B -> A"), std::string::npos) << e.what();
    }
    EXPECT_TRUE(events().empty());
    EXPECT_FALSE(m_manager.is_module_started("C"));
}

TEST_F(LifecycleManagerTest, ThrowingStartupStopsModulesAlreadyRunning)
{
    m_manager.register_module(make_module("A", &start_a, &stop_a));
    m_manager.register_module(make_module("B", &start_b_throws, &stop_b, {"A"}));
    m_manager.register_module(make_module("C", &start_c, &stop_c, {"B"}));
    try
    {
        initialize();
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        const std::string what = e.what();
        EXPECT_NE(what.find("'B'"), std::string::npos) << what;
        EXPECT_NE(what.find("no device"), std::string::npos) << what;
    }

    EXPECT_EQ(events(), (std::vector<std::string>{"start A", "stop A"}));
    EXPECT_TRUE(m_manager.is_finalized());
    EXPECT_FALSE(m_manager.is_module_started("A"));
    EXPECT_FALSE(m_manager.is_module_started("B"));
    EXPECT_FALSE(m_manager.is_module_started("C"));

    // Already finalized by the rollback.
    finalize();
    EXPECT_EQ(events().size(), 2u);
}

TEST_F(LifecycleManagerTest, OverrunningShutdownIsAbandoned)
{
    m_manager.register_module(make_module("A", &start_a, &stop_a));
    m_manager.register_module(
        make_module("Slow", nullptr, &stop_slow, {"A"}, std::chrono::milliseconds(30)));
    initialize();
    EXPECT_TRUE(m_manager.is_module_started("Slow"));

    const auto start = std::chrono::steady_clock::now();
    finalize();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(400));

    EXPECT_FALSE(m_manager.is_module_started("Slow"));
    EXPECT_EQ(events(), (std::vector<std::string>{"start A", "stop A"}));
}
