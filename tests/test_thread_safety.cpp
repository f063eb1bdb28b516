/// @file test_thread_safety.cpp
/// @brief Concurrent diff / format / patch calls sharing formatters and options.

#include <jsondelta/jsondelta.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace jsondelta;

namespace {

const char* kLeft = R"({"id":"root","children":[
    {"id":"buttons","props":{"label":"Go"}},
    {"id":"product-idx-1","props":{"content":"Widget"}},
    {"id":"product-idx-2","props":{"content":"Gadget"}},
    {"id":"product-idx-3","props":{"content":"Gizmo"}}],
    "meta":{"rev":1,"tags":["a","b","c"]}})";

const char* kRight = R"({"id":"root","children":[
    {"id":"buttons","props":{"label":"Go!"}},
    {"id":"refreshing-text","props":{"content":"Refreshing..."}},
    {"id":"product-idx-3","props":{"content":"Gadget"}},
    {"id":"product-idx-2","props":{"content":"Widget"}},
    {"id":"product-idx-4","props":{"content":"Gizmo"}}],
    "meta":{"rev":2,"tags":["c","a"]}})";

/// Spin barrier: every thread starts its loop at the same moment.
void arrive_and_wait(std::atomic<int>& waiting) {
    waiting.fetch_sub(1, std::memory_order_acq_rel);
    while (waiting.load(std::memory_order_acquire) > 0) std::this_thread::yield();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Multithreaded tests
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ThreadSafety, SharedFormattersAndOptions) {
    const auto opts = DiffOptions::keyed_by("id");
    const NativeFormatter native{};
    const JsonPatchFormatter json_patch{};

    // Single-threaded reference output.
    const auto left = parse(kLeft);
    const auto right = parse(kRight);
    const auto reference = diff(left, right, opts);
    ASSERT_TRUE(reference.has_value());
    const std::string expected_native = native.format(*reference).dump();
    const std::string expected_ops = json_patch.format(*reference).dump();

    constexpr int kThreads = 4;
    constexpr int kIterations = 100;

    std::atomic<int> waiting{kThreads};
    std::atomic<int> exception_count{0};
    std::atomic<int> mismatch_count{0};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            // Each thread owns its documents; formatters and options are shared.
            const auto l = parse(kLeft);
            const auto r = parse(kRight);
            arrive_and_wait(waiting);
            for (int i = 0; i < kIterations; ++i) {
                try {
                    auto d = diff(l, r, opts);
                    if (!d || native.format(*d).dump() != expected_native ||
                        json_patch.format(*d).dump() != expected_ops) {
                        mismatch_count.fetch_add(1, std::memory_order_relaxed);
                        continue;
                    }
                    auto doc = l;
                    patch(doc, native.format(*d));
                    if (doc != r) mismatch_count.fetch_add(1, std::memory_order_relaxed);
                } catch (const std::exception&) {
                    exception_count.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    for (auto& th : threads) th.join();
    EXPECT_EQ(exception_count.load(), 0);
    EXPECT_EQ(mismatch_count.load(), 0);
}

TEST(ThreadSafety, SharedDocumentCopyWithLargeObjects) {
    // A copy (not a parse) of a document whose objects are above the index
    // threshold, read by every thread at once.
    Object wide;
    for (int i = 0; i < 40; ++i) wide.append("field" + std::to_string(i), JsonValue(i));
    Object root;
    root.append("config", JsonValue(wide));
    root.append("items", parse(R"([{"id":1},{"id":2},{"id":3}])"));
    const JsonValue snapshot(root);
    const JsonValue left = snapshot;

    JsonValue edited = snapshot;
    edited["config"]["field7"] = JsonValue("changed");
    edited["config"].erase("field30");
    edited["items"].as_array().push_back(parse(R"({"id":4})"));
    const JsonValue right = edited;

    const auto reference = diff(left, right);
    ASSERT_TRUE(reference.has_value());
    const std::string expected = to_native(*reference).dump();

    constexpr int kThreads = 4;
    constexpr int kIterations = 100;

    std::atomic<int> waiting{kThreads};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            arrive_and_wait(waiting);
            for (int i = 0; i < kIterations; ++i) {
                try {
                    auto d = diff(left, right);
                    if (!d || to_native(*d).dump() != expected ||
                        left.find("config")->find("field39") == nullptr)
                        failures.fetch_add(1, std::memory_order_relaxed);
                } catch (const std::exception&) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    for (auto& th : threads) th.join();
    EXPECT_EQ(failures.load(), 0);
}

TEST(ThreadSafety, SharedKeyFinderSeesEveryCall) {
    std::atomic<int> calls{0};
    DiffOptions opts;
    opts.array_object_item_key_finder = [&calls](const JsonValue& item, size_t) -> std::optional<std::string> {
        calls.fetch_add(1, std::memory_order_relaxed);
        const JsonValue* id = item.find("id");
        if (!id || !id->is_string()) return std::nullopt;
        return id->as_string();
    };

    constexpr int kThreads = 4;
    constexpr int kIterations = 50;

    std::atomic<int> waiting{kThreads};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            const auto l = parse(R"([{"id":"a"},{"id":"b"},{"id":"c"}])");
            const auto r = parse(R"([{"id":"c"},{"id":"a"},{"id":"b"}])");
            arrive_and_wait(waiting);
            for (int i = 0; i < kIterations; ++i) {
                auto d = diff(l, r, opts);
                if (!d || edit_count(*d->get_if<ArrayDelta>()) != 1)
                    failures.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }

    for (auto& th : threads) th.join();
    EXPECT_EQ(failures.load(), 0);
    // Keys are computed once per element per call: 6 per diff.
    EXPECT_EQ(calls.load(), kThreads * kIterations * 6);
}
