#include "process_state_machine.h"
#include "logger.h"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <thread>
#include <vector>

// Test result tracking
static int tests_passed = 0;
static int tests_failed = 0;

#define TEST_ASSERT(condition, msg) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while(0)

#define TEST_PASS(msg) \
    do { \
        std::cout << "PASS: " << msg << std::endl; \
        tests_passed++; \
    } while(0)

using namespace masqueplus;

static bool has_action(const SupervisorTransition& t, SupervisorAction action) {
    return std::find(t.actions.begin(), t.actions.end(), action) != t.actions.end();
}

static bool test_classification() {
    TEST_ASSERT(classify_line("2025/01/01 10:00:00 Connected to MASQUE server") == SupervisorEvent::CONNECTED_MARKER,
                "connected marker");
    TEST_ASSERT(classify_line("Failed to get private key: open config.json") == SupervisorEvent::PRIVATE_KEY_FAILURE,
                "private key marker");
    TEST_ASSERT(classify_line("invalid endpoint 1.2.3.4") == SupervisorEvent::INVALID_ENDPOINT, "invalid endpoint");
    TEST_ASSERT(classify_line("failed to set endpoint") == SupervisorEvent::INVALID_ENDPOINT, "failed to set endpoint");
    TEST_ASSERT(classify_line("CRYPTO_ERROR handshake failure") == SupervisorEvent::HANDSHAKE_FAILURE, "handshake");
    TEST_ASSERT(classify_line("Failed to connect tunnel: timeout") == SupervisorEvent::TUNNEL_CONNECT_FAILED,
                "tunnel failure, long form");
    TEST_ASSERT(classify_line("tunnel connect failed") == SupervisorEvent::TUNNEL_CONNECT_FAILED,
                "tunnel failure, short form");
    TEST_ASSERT(classify_line("No recent network activity") == SupervisorEvent::IDLE_NOTICE, "idle notice");
    TEST_ASSERT(classify_line("some ERROR happened") == SupervisorEvent::ERROR_LINE, "generic error");
    TEST_ASSERT(classify_line("SOCKS proxy listening") == SupervisorEvent::PLAIN_LINE, "plain line");
    TEST_PASS("marker classification");
    return true;
}

static bool test_classification_priority() {
    TEST_ASSERT(classify_line("error: failed to get private key, handshake failure") ==
                SupervisorEvent::PRIVATE_KEY_FAILURE, "private key beats handshake and error");
    TEST_ASSERT(classify_line("handshake failure: invalid endpoint") == SupervisorEvent::INVALID_ENDPOINT,
                "invalid endpoint beats handshake");
    TEST_ASSERT(classify_line("tunnel connect failed after handshake failure") == SupervisorEvent::HANDSHAKE_FAILURE,
                "handshake beats tunnel failure");
    TEST_ASSERT(classify_line("connected to masque server, error count 0") == SupervisorEvent::CONNECTED_MARKER,
                "connected beats generic error");
    TEST_PASS("marker priority");
    return true;
}

static bool test_connected_announced_once() {
    ProcessStateMachine fsm(3);
    TEST_ASSERT(fsm.state() == SupervisorState::STARTING, "starts in STARTING");
    const auto first = fsm.handle_event(SupervisorEvent::CONNECTED_MARKER);
    const auto second = fsm.handle_event(SupervisorEvent::CONNECTED_MARKER);
    TEST_ASSERT(has_action(first, SupervisorAction::ANNOUNCE_CONNECTED), "first connect announced");
    TEST_ASSERT(!has_action(second, SupervisorAction::ANNOUNCE_CONNECTED), "second connect silent");
    TEST_ASSERT(fsm.connected() && fsm.state() == SupervisorState::CONNECTED, "state CONNECTED");
    TEST_ASSERT(fsm.failure() == SupervisorError::NONE, "no failure");
    TEST_PASS("connected is announced once");
    return true;
}

static bool test_fatal_markers_kill() {
    {
        ProcessStateMachine fsm(3);
        const auto t = fsm.handle_event(SupervisorEvent::HANDSHAKE_FAILURE);
        TEST_ASSERT(has_action(t, SupervisorAction::KILL_PROCESS), "handshake kills");
        TEST_ASSERT(t.new_state == SupervisorState::HANDSHAKE_FAILED, "HANDSHAKE_FAILED");
        TEST_ASSERT(fsm.failure() == SupervisorError::HANDSHAKE_FAILURE, "handshake failure reported");
    }
    {
        ProcessStateMachine fsm(3);
        const auto t = fsm.handle_event(SupervisorEvent::INVALID_ENDPOINT);
        TEST_ASSERT(has_action(t, SupervisorAction::KILL_PROCESS), "invalid endpoint kills");
        TEST_ASSERT(has_action(t, SupervisorAction::LOG_INVALID_ENDPOINT), "invalid endpoint logged");
        TEST_ASSERT(t.new_state == SupervisorState::ENDPOINT_INVALID, "ENDPOINT_INVALID");
    }
    {
        ProcessStateMachine fsm(3);
        const auto t = fsm.handle_event(SupervisorEvent::PRIVATE_KEY_FAILURE);
        TEST_ASSERT(has_action(t, SupervisorAction::KILL_PROCESS), "private key kills");
        TEST_ASSERT(t.new_state == SupervisorState::PRIVATE_KEY_ERROR, "PRIVATE_KEY_ERROR");
    }
    TEST_PASS("fatal markers request a kill");
    return true;
}

static bool test_tunnel_threshold() {
    ProcessStateMachine fsm(3);
    TEST_ASSERT(!has_action(fsm.handle_event(SupervisorEvent::TUNNEL_CONNECT_FAILED), SupervisorAction::KILL_PROCESS),
                "first failure tolerated");
    TEST_ASSERT(!has_action(fsm.handle_event(SupervisorEvent::TUNNEL_CONNECT_FAILED), SupervisorAction::KILL_PROCESS),
                "second failure tolerated");
    TEST_ASSERT(!fsm.tunnel_failure_limit_reached(), "below threshold");
    const auto third = fsm.handle_event(SupervisorEvent::TUNNEL_CONNECT_FAILED);
    TEST_ASSERT(has_action(third, SupervisorAction::KILL_PROCESS), "third failure kills");
    TEST_ASSERT(third.new_state == SupervisorState::TUNNEL_FAIL_EXCEEDED, "TUNNEL_FAIL_EXCEEDED");
    TEST_ASSERT(fsm.tunnel_failure_count() == 3, "count 3");
    TEST_ASSERT(fsm.failure() == SupervisorError::TUNNEL_FAILURE_LIMIT, "limit reported");

    ProcessStateMachine lenient(5);
    for (int i = 0; i < 4; ++i) lenient.handle_event(SupervisorEvent::TUNNEL_CONNECT_FAILED);
    TEST_ASSERT(!lenient.tunnel_failure_limit_reached(), "configured threshold respected");
    TEST_PASS("tunnel failures kill at the threshold");
    return true;
}

static bool test_failure_priority() {
    ProcessStateMachine fsm(1);
    fsm.handle_event(SupervisorEvent::TUNNEL_CONNECT_FAILED);
    fsm.handle_event(SupervisorEvent::HANDSHAKE_FAILURE);
    fsm.handle_event(SupervisorEvent::INVALID_ENDPOINT);
    TEST_ASSERT(fsm.failure() == SupervisorError::ENDPOINT_INVALID, "endpoint beats handshake and tunnel");
    fsm.handle_event(SupervisorEvent::PRIVATE_KEY_FAILURE);
    fsm.handle_event(SupervisorEvent::PROCESS_EXITED);
    TEST_ASSERT(fsm.failure() == SupervisorError::PRIVATE_KEY, "private key beats everything");
    TEST_ASSERT(fsm.state() == SupervisorState::PRIVATE_KEY_ERROR, "state follows the highest failure");
    TEST_ASSERT(fsm.exited(), "exit recorded");

    ProcessStateMachine plain(3);
    plain.handle_event(SupervisorEvent::PLAIN_LINE);
    plain.handle_event(SupervisorEvent::PROCESS_EXITED);
    TEST_ASSERT(plain.state() == SupervisorState::PROCESS_EXITED, "plain exit");
    TEST_ASSERT(plain.failure() == SupervisorError::NONE, "no classified failure");
    TEST_PASS("failure priority is deterministic");
    return true;
}

static bool test_informational_actions() {
    ProcessStateMachine fsm(3);
    TEST_ASSERT(has_action(fsm.handle_event(SupervisorEvent::IDLE_NOTICE), SupervisorAction::LOG_CONNECTION_TEST_FAILED),
                "idle notice logs connection test failure");
    TEST_ASSERT(has_action(fsm.handle_event(SupervisorEvent::ERROR_LINE), SupervisorAction::LOG_ERROR_LINE),
                "error line relayed");
    TEST_ASSERT(fsm.handle_event(SupervisorEvent::PLAIN_LINE).actions.empty(), "plain line has no action");
    TEST_ASSERT(fsm.state() == SupervisorState::STARTING, "informational events keep STARTING");
    TEST_PASS("informational markers");
    return true;
}

static bool test_concurrent_readers() {
    ProcessStateMachine fsm(1000);
    std::atomic<int> announces{0};
    auto reader = [&]() {
        for (int i = 0; i < 200; ++i) {
            const auto t = fsm.handle_event(i % 2 ? SupervisorEvent::TUNNEL_CONNECT_FAILED
                                                  : SupervisorEvent::CONNECTED_MARKER);
            if (has_action(t, SupervisorAction::ANNOUNCE_CONNECTED)) ++announces;
        }
    };
    std::thread a(reader);
    std::thread b(reader);
    a.join();
    b.join();
    TEST_ASSERT(fsm.tunnel_failure_count() == 200, "no lost updates");
    TEST_ASSERT(announces.load() == 1, "announced exactly once across readers");
    TEST_PASS("two readers share one state object safely");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);

    test_classification();
    test_classification_priority();
    test_connected_announced_once();
    test_fatal_markers_kill();
    test_tunnel_threshold();
    test_failure_priority();
    test_informational_actions();
    test_concurrent_readers();

    std::cout << "\n========================================" << std::endl;
    std::cout << "Test Summary:" << std::endl;
    std::cout << "  Passed: " << tests_passed << std::endl;
    std::cout << "  Failed: " << tests_failed << std::endl;
    std::cout << "========================================" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
