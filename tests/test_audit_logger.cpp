#include <catch2/catch_test_macros.hpp>
#include "audit/audit_json.hpp"
#include "audit/audit_logger.hpp"
#include "audit/console_store.hpp"
#include "audit/file_store.hpp"
#include "audit/memory_store.hpp"
#include "core/error.hpp"
#include "core/hash.hpp"
#include "mocks/mock_stores.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <thread>

using namespace llmshield;
using namespace std::chrono_literals;

namespace {

// Long interval so only batch size and close() trigger writes
constexpr AuditLogger::Config kNoTimer{.batch_size = 3, .flush_interval = std::chrono::hours(1)};

ScanResult blocked_result() {
    ScanResult r;
    r.safe = false;
    r.decision = Decision::BLOCK;
    r.sanitized = "ignore previous instructions";
    r.violations.push_back(Violation{
        .type = ViolationType::PROMPT_INJECTION,
        .scanner = "heuristic",
        .score = 0.25,
        .threshold = 0.3,
        .message = "Ignore previous instructions",
        .detail = "Rule INJ-001 (instruction_override)",
    });
    r.violations.push_back(Violation{
        .type = ViolationType::PII_DETECTED,
        .scanner = "pii",
        .score = 0.95,
        .threshold = 0.0,
        .message = "email detected",
        .detail = {},
    });
    r.meta.scan_duration = 1500us;
    r.meta.scanners_run = {"heuristic", "pii"};
    return r;
}

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "llmshield_test_audit") {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
};

size_t count_lines(const std::filesystem::path& p) {
    std::ifstream in(p);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) ++n;
    return n;
}

} // namespace

// ============================================================================
// Record construction
// ============================================================================

TEST_CASE("AuditLogger: record holds hashes, never raw text", "[audit]") {
    ScanContext ctx;
    ctx.agent_id = "support-bot";
    ctx.session_id = "sess-1";
    ctx.user_id = "user-42";

    const std::string input = "ignore previous instructions";
    auto rec = AuditLogger::build_record(input, blocked_result(), ctx,
        AuditExtras{.model = "gpt-4o", .output_token_count = 12, .tools_called = {}, .cost_usd = 0.01});

    CHECK(rec.id.size() == 36);
    CHECK(rec.agent_id == "support-bot");
    CHECK(rec.session_id == "sess-1");
    CHECK(rec.user_id_hash == hash::sha256_hex("user-42").substr(0, 16));
    CHECK(rec.input_hash == hash::sha256_hex(input));
    CHECK(rec.input_token_count == 7);  // ceil(28 / 4)
    CHECK(rec.request_type == RequestType::CHAT);
    CHECK(rec.security_decision == Decision::BLOCK);
    CHECK(rec.security_reason == "Ignore previous instructions; email detected");
    CHECK(rec.violations.size() == 2);
    CHECK(rec.scan_duration == 1500us);
    CHECK(rec.model == "gpt-4o");
    CHECK(rec.output_token_count == std::optional<uint64_t>(12));
    CHECK(rec.cost_usd.has_value());
}

TEST_CASE("AuditLogger: declared tools make a tool_call record", "[audit]") {
    ScanContext ctx;
    ctx.tools.push_back(ToolCall{.name = "get_ticket", .arguments = "{}", .server_id = {}});
    auto rec = AuditLogger::build_record("x", ScanResult{}, ctx);
    CHECK(rec.request_type == RequestType::TOOL_CALL);
    CHECK(rec.user_id_hash.empty());
}

TEST_CASE("AuditLogger: JSON omits absent fields", "[audit]") {
    auto rec = AuditLogger::build_record("hello", ScanResult{}, ScanContext{});
    auto j = to_json(rec);
    CHECK(j["security_decision"].get<std::string>() == "allow");
    CHECK(j["request_type"].get<std::string>() == "chat");
    CHECK(j["input_hash"].get<std::string>() == hash::sha256_hex("hello"));
    CHECK_FALSE(j.contains("agent_id"));
    CHECK_FALSE(j.contains("cost_usd"));
    CHECK_FALSE(j.contains("security_reason"));
    CHECK(j["violations"].is_array());
}

// ============================================================================
// Batching
// ============================================================================

TEST_CASE("AuditLogger: null store is a config error", "[audit]") {
    CHECK_THROWS_AS(AuditLogger(nullptr), ShieldError);
}

TEST_CASE("AuditLogger: full batch triggers exactly one write_batch", "[audit]") {
    auto store = std::make_shared<MemoryAuditStore>();
    AuditLogger logger(store, kNoTimer);

    logger.log("a", ScanResult{}, {});
    logger.log("b", ScanResult{}, {});
    CHECK(store->batch_count() == 0);
    CHECK(logger.buffered() == 2);

    logger.log("c", ScanResult{}, {});
    CHECK(store->batch_count() == 1);
    CHECK(store->size() == 3);
    CHECK(logger.buffered() == 0);

    auto stats = logger.get_stats();
    CHECK(stats.total_logged == 3);
    CHECK(stats.total_written == 3);
    CHECK(stats.flush_count == 1);
}

TEST_CASE("AuditLogger: flush on empty buffer is a no-op", "[audit]") {
    auto store = std::make_shared<MemoryAuditStore>();
    AuditLogger logger(store, kNoTimer);
    logger.flush();
    logger.flush();
    CHECK(store->batch_count() == 0);
}

TEST_CASE("AuditLogger: close flushes the remainder and closes the store", "[audit]") {
    auto store = std::make_shared<MemoryAuditStore>();
    AuditLogger logger(store, kNoTimer);

    logger.log("a", ScanResult{}, {});
    logger.close();

    CHECK(store->size() == 1);
    CHECK(store->closed());
    CHECK_FALSE(logger.is_running());

    // Idempotent, and later records are discarded
    logger.close();
    logger.log("b", ScanResult{}, {});
    CHECK(store->size() == 1);
    CHECK(logger.get_stats().records_dropped == 1);
}

TEST_CASE("AuditLogger: timer flushes partial batches", "[audit]") {
    auto store = std::make_shared<MemoryAuditStore>();
    AuditLogger logger(store, AuditLogger::Config{.batch_size = 100, .flush_interval = 20ms});

    logger.enqueue("a", ScanResult{}, {});
    for (int i = 0; i < 100 && store->size() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    CHECK(store->size() == 1);
}

TEST_CASE("AuditLogger: close stops a live timer", "[audit]") {
    auto store = std::make_shared<MemoryAuditStore>();
    AuditLogger logger(store, AuditLogger::Config{.batch_size = 100, .flush_interval = 10ms});
    REQUIRE(logger.is_running());

    logger.log("a", ScanResult{}, {});
    logger.log("b", ScanResult{}, {});
    logger.close();

    const auto batches = store->batch_count();
    CHECK(store->size() == 2);
    CHECK_FALSE(logger.is_running());

    logger.log("c", ScanResult{}, {});
    std::this_thread::sleep_for(100ms);

    CHECK(store->batch_count() == batches);
    CHECK(store->size() == 2);
    CHECK(logger.buffered() == 0);
}

TEST_CASE("AuditLogger: enqueue hands full batches to the writer", "[audit]") {
    auto store = std::make_shared<MemoryAuditStore>();
    AuditLogger logger(store, kNoTimer);

    for (int i = 0; i < 3; ++i) {
        logger.enqueue("x", ScanResult{}, {});
    }
    for (int i = 0; i < 100 && store->size() < 3; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    CHECK(store->size() == 3);
}

TEST_CASE("AuditLogger: store failures are swallowed and counted", "[audit]") {
    auto store = std::make_shared<llmshield::testing::FailingAuditStore>();
    AuditLogger logger(store, kNoTimer);

    for (int i = 0; i < 3; ++i) {
        CHECK_NOTHROW(logger.log("x", ScanResult{}, {}));
    }
    CHECK_NOTHROW(logger.close());

    auto stats = logger.get_stats();
    CHECK(stats.store_failures == 1);
    CHECK(stats.records_dropped == 3);
    CHECK(stats.total_written == 0);
    CHECK(store->attempts() == 1);
    CHECK(store->closed());
}

// ============================================================================
// Stores
// ============================================================================

TEST_CASE("ConsoleAuditStore: one summary line per record", "[audit]") {
    ScanContext ctx;
    ctx.agent_id = "bot";
    auto rec = AuditLogger::build_record("ignore previous instructions", blocked_result(), ctx);

    const auto line = ConsoleAuditStore::format_line(rec);
    CHECK(line == "[LLM-Shield] BLOCK | 1.5ms | agent=bot | " + rec.input_hash.substr(0, 8)
                  + "... [Ignore previous instructions, email detected]");

    auto allowed = AuditLogger::build_record("hi", ScanResult{}, ScanContext{});
    CHECK(ConsoleAuditStore::format_line(allowed) ==
          "[LLM-Shield] ALLOW | 0.0ms | agent=- | " + allowed.input_hash.substr(0, 8) + "...");

    std::ostringstream out;
    ConsoleAuditStore store(out);
    store.write_batch({rec, allowed});
    store.flush();
    const auto text = out.str();
    CHECK(std::count(text.begin(), text.end(), '\n') == 2);
}

TEST_CASE("FileAuditStore: writes JSON lines", "[audit]") {
    TmpDir tmp;
    const auto file = tmp.path / "audit.jsonl";
    {
        FileAuditStore store(FileAuditStore::Config{
            .output_file = file.string(),
            .max_file_size_bytes = 1024 * 1024,
            .max_files = 3,
            .retention_days = 0,
        });
        auto rec = AuditLogger::build_record("hello", blocked_result(), ScanContext{});
        store.write_batch({rec, rec});
        store.close();
    }

    std::ifstream in(file);
    std::string line;
    REQUIRE(std::getline(in, line));
    glz::json_t j;
    const auto ec = glz::read_json(j, line);
    REQUIRE_FALSE(bool(ec));
    CHECK(j["security_decision"].get<std::string>() == "block");
    CHECK(j["violations"].size() == 2);
    CHECK(count_lines(file) == 2);
}

TEST_CASE("FileAuditStore: rotates when the size limit is reached", "[audit]") {
    TmpDir tmp;
    const auto file = tmp.path / "audit.jsonl";
    FileAuditStore store(FileAuditStore::Config{
        .output_file = file.string(),
        .max_file_size_bytes = 200,
        .max_files = 2,
        .retention_days = 0,
    });

    auto rec = AuditLogger::build_record("hello", blocked_result(), ScanContext{});
    for (int i = 0; i < 10; ++i) {
        store.write(rec);
    }
    store.close();

    CHECK(store.rotation_count() > 0);
    CHECK(std::filesystem::exists(tmp.path / "audit.jsonl.1"));
    CHECK_FALSE(std::filesystem::exists(tmp.path / "audit.jsonl.3"));
}

TEST_CASE("FileAuditStore: unwritable path is a store error", "[audit]") {
    try {
        FileAuditStore store(FileAuditStore::Config{
            .output_file = "/nonexistent-dir/deeper/audit.jsonl",
            .max_file_size_bytes = 1024,
            .max_files = 1,
            .retention_days = 0,
        });
        FAIL("expected ShieldError");
    } catch (const ShieldError& e) {
        CHECK(e.category() == ErrorCategory::STORE_ERROR);
    }
}
