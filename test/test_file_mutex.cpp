/*

test_file_mutex.cpp
-------------------

flock-based distributed_mutex.

*/

#define BOOST_TEST_MODULE file_mutex_test

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include <tokenxx/lock/file_mutex.hpp>
#include "test_support.hpp"

using tokenxx::test::scratch_dir;


BOOST_AUTO_TEST_CASE(same_instance_is_not_reentrant)
{
    scratch_dir dir;
    tokenxx::lock::file_mutex mutex(dir.path());
    BOOST_TEST(mutex.try_acquire("zoho").value());
    BOOST_TEST(!mutex.try_acquire("zoho").value());
    BOOST_TEST(mutex.release("zoho").has_value());
    BOOST_TEST(mutex.try_acquire("zoho").value());
}

BOOST_AUTO_TEST_CASE(instances_exclude_each_other)
{
    scratch_dir dir;
    tokenxx::lock::file_mutex first(dir.path());
    tokenxx::lock::file_mutex second(dir.path());

    BOOST_TEST(first.try_acquire("zoho").value());
    BOOST_TEST(!second.try_acquire("zoho").value());
    BOOST_TEST(second.try_acquire("other").value());

    BOOST_TEST(first.release("zoho").has_value());
    BOOST_TEST(second.try_acquire("zoho").value());
}

BOOST_AUTO_TEST_CASE(destruction_releases_held_keys)
{
    scratch_dir dir;
    tokenxx::lock::file_mutex survivor(dir.path());
    {
        tokenxx::lock::file_mutex holder(dir.path());
        BOOST_TEST(holder.try_acquire("zoho").value());
        BOOST_TEST(!survivor.try_acquire("zoho").value());
    }
    BOOST_TEST(survivor.try_acquire("zoho").value());
}

BOOST_AUTO_TEST_CASE(release_without_hold_is_noop)
{
    scratch_dir dir;
    tokenxx::lock::file_mutex mutex(dir.path());
    BOOST_TEST(mutex.release("zoho").has_value());
}

BOOST_AUTO_TEST_CASE(lock_path_is_sanitized)
{
    scratch_dir dir;
    tokenxx::lock::file_mutex mutex(dir.path());
    BOOST_TEST(mutex.lock_path("zoho") == dir.path() / "zoho.lock");
    BOOST_TEST(mutex.lock_path("../etc/passwd") == dir.path() / "_.._etc_passwd.lock");
    BOOST_TEST(mutex.lock_path("") == dir.path() / "_.lock");
}

BOOST_AUTO_TEST_CASE(one_winner_among_instances)
{
    scratch_dir dir;
    std::atomic<int> winners{0};
    std::vector<std::unique_ptr<tokenxx::lock::file_mutex>> mutexes;
    for (int i = 0; i < 8; ++i)
        mutexes.push_back(std::make_unique<tokenxx::lock::file_mutex>(dir.path()));

    std::vector<std::thread> threads;
    for (auto& m : mutexes)
    {
        threads.emplace_back([&winners, mutex = m.get()]
        {
            auto res = mutex->try_acquire("zoho");
            if (res && *res)
                ++winners;
        });
    }
    for (auto& t : threads)
        t.join();
    BOOST_TEST(winners.load() == 1);
}
