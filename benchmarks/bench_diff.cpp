/// @file bench_diff.cpp
/// @brief Performance benchmarks for jsondelta.
///
/// Measured operations:
///   - Parsing and serialization of the benchmark documents
///   - Diff: object trees, keyed arrays, unkeyed arrays (LCS window size)
///   - Formatting: native delta, RFC 6902 JSON Patch
///   - Patching: in-memory delta, native delta, JSON Patch

#include <jsondelta/jsondelta.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <random>
#include <string>
#include <utility>

using namespace jsondelta;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// Catalogue of @p count items (~100 bytes each).
static std::string generate_catalogue(int count) {
    std::string s = R"({"data":[)";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"(","price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"quantity":)" + std::to_string(i % 100) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","common"],"active":)" + (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":)" + std::to_string(count) + R"(,"generated":true}})";
    return s;
}

/// The catalogue with a few edits: one price changed every 50 items, the
/// first item moved to the end, one item removed and one added.
static JsonValue edit_catalogue(const JsonValue& doc) {
    JsonValue out = doc;
    Array& items = out["data"].as_array();
    for (size_t i = 0; i < items.size(); i += 50)
        items[i]["price"] = JsonValue(items[i]["price"].as_float() + 1.0);
    if (items.size() > 2) {
        JsonValue first = std::move(items.front());
        items.erase(items.begin());
        items.push_back(std::move(first));
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(items.size() / 2));
    }
    Object added;
    added.append("id", JsonValue(-1));
    added.append("title", JsonValue("new"));
    items.insert(items.begin(), JsonValue(std::move(added)));
    out["meta"]["total"] = JsonValue(static_cast<int64_t>(items.size()));
    return out;
}

/// Two integer arrays of length @p n sharing about 80% of their elements.
static std::pair<JsonValue, JsonValue> generate_int_arrays(int n) {
    std::mt19937 rng(42u);
    std::uniform_int_distribution<int> noise(0, 4);
    Array left, right;
    for (int i = 0; i < n; ++i) {
        left.emplace_back(i);
        if (noise(rng) != 0) right.emplace_back(i);
        else right.emplace_back(n + i);
    }
    return {JsonValue(std::move(left)), JsonValue(std::move(right))};
}

// ═══════════════════════════════════════════════════════════════════════════════
// Parsing and serialization
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ParseCatalogue(benchmark::State& state) {
    auto input = generate_catalogue(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_ParseCatalogue)->Arg(10)->Arg(1000);

static void BM_SerializeCatalogue(benchmark::State& state) {
    auto v = parse(generate_catalogue(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        auto s = v.dump();
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeCatalogue)->Arg(10)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// Diff
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DiffIdentical(benchmark::State& state) {
    auto left = parse(generate_catalogue(static_cast<int>(state.range(0))));
    auto right = left;
    for (auto _ : state) {
        auto d = diff(left, right);
        benchmark::DoNotOptimize(d);
    }
}
BENCHMARK(BM_DiffIdentical)->Arg(100)->Arg(1000);

static void BM_DiffCatalogueKeyed(benchmark::State& state) {
    auto left = parse(generate_catalogue(static_cast<int>(state.range(0))));
    auto right = edit_catalogue(left);
    const auto opts = DiffOptions::keyed_by("id");
    for (auto _ : state) {
        auto d = diff(left, right, opts);
        benchmark::DoNotOptimize(d);
    }
}
BENCHMARK(BM_DiffCatalogueKeyed)->Arg(100)->Arg(1000);

static void BM_DiffCatalogueUnkeyed(benchmark::State& state) {
    auto left = parse(generate_catalogue(static_cast<int>(state.range(0))));
    auto right = edit_catalogue(left);
    for (auto _ : state) {
        auto d = diff(left, right);
        benchmark::DoNotOptimize(d);
    }
}
BENCHMARK(BM_DiffCatalogueUnkeyed)->Arg(100)->Arg(1000);

static void BM_DiffIntArrays(benchmark::State& state) {
    auto [left, right] = generate_int_arrays(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto d = diff(left, right);
        benchmark::DoNotOptimize(d);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_DiffIntArrays)->RangeMultiplier(4)->Range(16, 1024)->Complexity();

// ═══════════════════════════════════════════════════════════════════════════════
// Formatting
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_FormatNative(benchmark::State& state) {
    auto left = parse(generate_catalogue(1000));
    auto delta = diff(left, edit_catalogue(left), DiffOptions::keyed_by("id"));
    const NativeFormatter formatter{};
    for (auto _ : state) {
        auto v = formatter.format(*delta);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_FormatNative);

static void BM_FormatJsonPatch(benchmark::State& state) {
    auto left = parse(generate_catalogue(1000));
    auto delta = diff(left, edit_catalogue(left), DiffOptions::keyed_by("id"));
    const JsonPatchFormatter formatter{};
    for (auto _ : state) {
        auto v = formatter.format(*delta);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_FormatJsonPatch);

// ═══════════════════════════════════════════════════════════════════════════════
// Patching
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_PatchDelta(benchmark::State& state) {
    auto left = parse(generate_catalogue(1000));
    auto delta = diff(left, edit_catalogue(left), DiffOptions::keyed_by("id"));
    for (auto _ : state) {
        state.PauseTiming();
        auto doc = left;
        state.ResumeTiming();
        patch(doc, delta);
        benchmark::DoNotOptimize(doc);
    }
}
BENCHMARK(BM_PatchDelta);

static void BM_PatchNative(benchmark::State& state) {
    auto left = parse(generate_catalogue(1000));
    auto native = diff(left, edit_catalogue(left), NativeFormatter{}, DiffOptions::keyed_by("id"));
    for (auto _ : state) {
        state.PauseTiming();
        auto doc = left;
        state.ResumeTiming();
        patch(doc, *native);
        benchmark::DoNotOptimize(doc);
    }
}
BENCHMARK(BM_PatchNative);

static void BM_ApplyJsonPatch(benchmark::State& state) {
    auto left = parse(generate_catalogue(1000));
    auto ops = diff(left, edit_catalogue(left), JsonPatchFormatter{}, DiffOptions::keyed_by("id"));
    for (auto _ : state) {
        state.PauseTiming();
        auto doc = left;
        state.ResumeTiming();
        apply_json_patch(doc, *ops);
        benchmark::DoNotOptimize(doc);
    }
}
BENCHMARK(BM_ApplyJsonPatch);
