#include <gtest/gtest.h>

#include <tandem/registry.hpp>
#include <tandem/resource_keys.hpp>
#include <tandem/thread_names.hpp>

#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace tandem;

TEST(ThreadNames, UnnamedThreadGetsSynthesizedName) {
    Registry reg;
    const auto name = current_thread_name(reg);
    EXPECT_EQ(name, "Thread-" + std::to_string(current_thread_token()));
    EXPECT_FALSE(thread_name(current_thread_token(), reg).has_value());
}

TEST(ThreadNames, TokenIsStablePerThread) {
    const auto token = current_thread_token();
    EXPECT_NE(token, 0u);
    EXPECT_EQ(current_thread_token(), token);

    ThreadToken worker_token = 0;
    std::thread worker([&worker_token]() { worker_token = current_thread_token(); });
    worker.join();
    EXPECT_NE(worker_token, token);
}

TEST(ThreadNames, NameIsStoredPerThread) {
    Registry reg;
    ASSERT_TRUE(set_current_thread_name("main", reg));
    EXPECT_EQ(current_thread_name(reg), "main");
    EXPECT_TRUE(reg.holds<ThreadNameTable>(keys::THREAD_NAMES));

    std::string seen_in_worker;
    ThreadToken worker_token = 0;
    std::thread worker([&]() {
        worker_token = current_thread_token();
        if (set_current_thread_name("worker", reg)) {
            seen_in_worker = current_thread_name(reg);
        }
    });
    worker.join();

    EXPECT_EQ(seen_in_worker, "worker");
    EXPECT_EQ(thread_name(worker_token, reg).value_or(""), "worker");
    EXPECT_EQ(current_thread_name(reg), "main");
}

TEST(ThreadNames, RenameOverwrites) {
    Registry reg;
    ASSERT_TRUE(set_current_thread_name("first", reg));
    ASSERT_TRUE(set_current_thread_name("second", reg));
    EXPECT_EQ(current_thread_name(reg), "second");
}

TEST(ThreadNames, ClearDropsEntry) {
    Registry reg;
    EXPECT_FALSE(clear_current_thread_name(reg));

    ASSERT_TRUE(set_current_thread_name("temp", reg));
    EXPECT_TRUE(clear_current_thread_name(reg));
    EXPECT_FALSE(clear_current_thread_name(reg));
    EXPECT_EQ(current_thread_name(reg).rfind("Thread-", 0), 0u);
}

// Thread ids are recycled by the OS once a thread is joined; a name must not
// be inherited by whichever thread comes next.
TEST(ThreadNames, NameDoesNotPassToLaterThreads) {
    Registry reg;
    for (int round = 0; round < 16; ++round) {
        std::thread named([&reg]() { EXPECT_TRUE(set_current_thread_name("render", reg)); });
        named.join();

        std::string label;
        std::thread unnamed([&]() { label = current_thread_name(reg); });
        unnamed.join();

        EXPECT_EQ(label.rfind("Thread-", 0), 0u) << "round " << round << " got " << label;
    }
}

TEST(ThreadNames, WrongTypedTableIsRejected) {
    Registry reg;
    ASSERT_EQ(reg.register_resource(keys::THREAD_NAMES, 17), InsertResult::Inserted);

    EXPECT_FALSE(set_current_thread_name("main", reg));
    EXPECT_FALSE(clear_current_thread_name(reg));
    EXPECT_EQ(current_thread_name(reg).rfind("Thread-", 0), 0u);
    EXPECT_EQ(reg.get<int>(keys::THREAD_NAMES).value_or(0), 17);
}

TEST(ThreadNames, ConcurrentFirstUseKeepsEveryName) {
    Registry reg;
    constexpr int kThreads = 8;

    std::vector<std::thread> workers;
    std::vector<ThreadToken> tokens(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t]() {
            tokens[static_cast<size_t>(t)] = current_thread_token();
            EXPECT_TRUE(set_current_thread_name("worker-" + std::to_string(t), reg));
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(std::set<ThreadToken>(tokens.begin(), tokens.end()).size(), static_cast<size_t>(kThreads));
    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(thread_name(tokens[static_cast<size_t>(t)], reg).value_or(""),
                  "worker-" + std::to_string(t));
    }
}
