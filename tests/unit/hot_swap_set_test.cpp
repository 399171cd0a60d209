#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include "service/HotSwapSet.hpp"
#include "test_support.hpp"

using hearth::service::HotSwapSet;

struct Widget
{
    explicit Widget(std::string label, bool failSetup = false, int *destroyed = nullptr)
        : label(std::move(label)), failSetup(failSetup), destroyed(destroyed) {}
    ~Widget()
    {
        if (destroyed)
            ++*destroyed;
    }

    void Setup()
    {
        if (failSetup)
            throw std::runtime_error("pin busy");
        ready = true;
    }

    std::string label;
    bool failSetup;
    int *destroyed;
    bool ready = false;
};

using WidgetSet = HotSwapSet<Widget>;

static WidgetSet::Candidate Make(const std::string &key, const std::string &fp, bool fail = false, int *destroyed = nullptr)
{
    return {key, fp, [=]()
            { return std::make_shared<Widget>(key + "@" + fp, fail, destroyed); }};
}

void test_diff_reload()
{
    WidgetSet set("Widgets");
    auto stats = set.Reload({Make("a", "1"), Make("b", "1"), Make("c", "1")});
    assert(stats.added == 3 && stats.kept == 0);
    assert(set.Size() == 3);
    assert(set.Find("a")->ready);

    auto oldA = set.Find("a");
    auto oldB = set.Find("b");

    stats = set.Reload({Make("a", "1"), Make("b", "2"), Make("d", "1")});
    assert(stats.kept == 1);
    assert(stats.updated == 1);
    assert(stats.added == 1);
    assert(stats.removed == 1);

    // Unchanged entries keep the same instance.
    assert(set.Find("a") == oldA);
    assert(set.Find("b") != oldB);
    assert(set.Find("b")->label == "b@2");
    assert(!set.Find("c"));
    assert(set.Find("d"));
    std::cout << "test_diff_reload passed\n";
}

void test_failed_setup_is_excluded()
{
    WidgetSet set("Widgets");
    hearth::test::StreamCapture err(std::cerr);
    auto stats = set.Reload({Make("good", "1"), Make("bad", "1", true)});
    assert(stats.added == 1);
    assert(set.Size() == 1);
    assert(!set.Find("bad"));
    assert(err.Text().find("[Widgets] ERROR: setup of 'bad' failed: pin busy") != std::string::npos);

    // A failed update drops the old instance too.
    stats = set.Reload({Make("good", "2", true)});
    assert(set.Size() == 0);
    assert(stats.removed == 1);
    std::cout << "test_failed_setup_is_excluded passed\n";
}

void test_duplicate_keys_keep_the_first()
{
    WidgetSet set("Widgets");
    hearth::test::StreamCapture err(std::cerr);
    set.Reload({Make("x", "1"), Make("x", "2")});
    assert(set.Size() == 1);
    assert(set.Find("x")->label == "x@1");
    assert(err.Text().find("duplicate key 'x'") != std::string::npos);
    std::cout << "test_duplicate_keys_keep_the_first passed\n";
}

void test_snapshot_outlives_reload()
{
    int destroyed = 0;
    WidgetSet set("Widgets");
    set.Reload({Make("a", "1", false, &destroyed), Make("b", "1", false, &destroyed)});

    {
        // A cycle in progress holds its snapshot across a reload.
        auto inFlight = set.Snapshot();
        set.Reload({Make("b", "1", false, &destroyed)});
        assert(set.Size() == 1);
        assert(inFlight->size() == 2);
        assert(inFlight->at("a").instance->ready);
        assert(destroyed == 0);
    }
    assert(destroyed == 1);

    set.Clear();
    assert(destroyed == 2);
    assert(set.Size() == 0);
    std::cout << "test_snapshot_outlives_reload passed\n";
}

void test_null_builder_is_rejected()
{
    WidgetSet set("Widgets");
    hearth::test::StreamCapture err(std::cerr);
    auto stats = set.Reload({{"empty", "1", []()
                              { return std::shared_ptr<Widget>(); }}});
    assert(stats.added == 0);
    assert(set.Size() == 0);
    std::cout << "test_null_builder_is_rejected passed\n";
}

int main()
{
    test_diff_reload();
    test_failed_setup_is_excluded();
    test_duplicate_keys_keep_the_first();
    test_snapshot_outlives_reload();
    test_null_builder_is_rejected();
    std::cout << "All hot swap set tests passed!\n";
    return 0;
}
