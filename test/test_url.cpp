#include <doctest/doctest.h>

#include <dumploader/context.hpp>
#include <dumploader/mirror.hpp>
#include <dumploader/url.hpp>

using namespace dumploader;

TEST_SUITE("url")
{
    TEST_CASE("join_url")
    {
        CHECK_EQ(join_url("https://dumps.wikimedia.org", "enwiki"),
                 "https://dumps.wikimedia.org/enwiki");
        CHECK_EQ(join_url("https://dumps.wikimedia.org/", "/enwiki/20240101/a.bz2"),
                 "https://dumps.wikimedia.org/enwiki/20240101/a.bz2");
        CHECK_EQ(join_url("https://mirror.org/dumps", "enwiki", "20240101", "dumpstatus.json"),
                 "https://mirror.org/dumps/enwiki/20240101/dumpstatus.json");
        CHECK_EQ(join_url("", "a.txt"), "a.txt");
        CHECK_EQ(join_url("https://a.org", "https://b.org/x"), "https://b.org/x");
        CHECK_EQ(join_url("https://a.org", ""), "https://a.org");
    }

    TEST_CASE("has_scheme")
    {
        CHECK(has_scheme("http://a.org"));
        CHECK(has_scheme("file:///tmp/x"));
        CHECK_FALSE(has_scheme("a.org/x"));
        CHECK_FALSE(has_scheme("/x"));
    }

    TEST_CASE("resolve_url")
    {
        CHECK_EQ(resolve_url("http://a.org/enwiki/", "20240101/"), "http://a.org/enwiki/20240101/");
        CHECK_EQ(resolve_url("http://a.org/enwiki/index.html", "x.txt"), "http://a.org/enwiki/x.txt");
        CHECK_EQ(resolve_url("http://a.org/enwiki/", "http://b.org/y"), "http://b.org/y");
    }

    TEST_CASE("url_decode")
    {
        CHECK_EQ(url_decode("a%20b.txt"), "a b.txt");
        CHECK_EQ(url_decode("100%25"), "100%");
        CHECK_EQ(url_decode("bad%zz"), "bad%zz");
        CHECK_EQ(url_decode("end%4"), "end%4");
    }

    TEST_CASE("url_handler")
    {
        URLHandler u("https://user@mirror.org:8080/dumps/enwiki?x=1");
        CHECK_EQ(u.scheme(), "https");
        CHECK_EQ(u.host(), "mirror.org");
        CHECK_EQ(u.port(), "8080");
        CHECK_EQ(u.path(), "/dumps/enwiki");
        CHECK_EQ(u.query(), "x=1");
    }

    TEST_CASE("mirror_selection")
    {
        Context ctx;
        ctx.retry_default_timeout = std::chrono::seconds(60);

        auto m1 = std::make_shared<Mirror>(ctx, "http://one.org//");
        auto m2 = std::make_shared<Mirror>(ctx, "http://two.org");
        mirror_list mirrors{ m1, m2 };

        CHECK_EQ(m1->url(), "http://one.org");
        CHECK_EQ(m1->url_for("enwiki/a.txt"), "http://one.org/enwiki/a.txt");

        CHECK_EQ(pick_mirror(mirrors, nullptr), m1);
        CHECK_EQ(pick_mirror(mirrors, m1), m2);

        // A failing mirror is skipped until its cooldown is over.
        m2->begin_transfer();
        m2->end_transfer(false, 100);
        CHECK(m2->cooling_down());
        CHECK_EQ(m2->consecutive_failures(), 1);
        CHECK_EQ(m2->stats().running, 0);
        CHECK_EQ(m2->stats().bytes_received, 100);
        CHECK_EQ(pick_mirror(mirrors, m1), m1);

        // A second failure during the cooldown does not extend it.
        const auto until = m2->cooldown_until();
        m2->end_transfer(false);
        CHECK_EQ(m2->consecutive_failures(), 1);
        CHECK(m2->cooldown_until() == until);

        m2->end_transfer(true);
        CHECK_FALSE(m2->cooling_down());
        CHECK_EQ(m2->consecutive_failures(), 0);

        // A mirror failing seriously before any success goes to the back of the list.
        m1->end_transfer(false);
        reorder_mirrors(mirrors, m1, false, true);
        CHECK_EQ(mirrors.back(), m1);
        CHECK_EQ(mirrors.front(), m2);
    }

    TEST_CASE("mirror_ranking")
    {
        Context ctx;
        ctx.retry_default_timeout = std::chrono::milliseconds(0);

        auto good = std::make_shared<Mirror>(ctx, "http://good.org");
        auto flaky = std::make_shared<Mirror>(ctx, "http://flaky.org");
        mirror_list mirrors{ flaky, good };

        CHECK_LT(good->stats().success_rate(), 0.0);
        for (int i = 0; i < 3; ++i)
        {
            good->end_transfer(true);
        }
        CHECK_EQ(good->stats().success_rate(), doctest::Approx(1.0));

        flaky->end_transfer(true);
        flaky->end_transfer(false);
        flaky->end_transfer(false);
        CHECK_EQ(flaky->stats().success_rate(), doctest::Approx(1.0 / 3));

        // One place at a time.
        reorder_mirrors(mirrors, good, true, false);
        CHECK_EQ(mirrors.front(), good);
        reorder_mirrors(mirrors, good, true, false);
        CHECK_EQ(mirrors.front(), good);
    }
}
