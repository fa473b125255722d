// demo.cpp
// Walkthrough of the red-black tree: rotations on insert, a two-child
// removal and the rejected-insert errors, printed step by step.
// -------------------------------------------------------------------
// Build: see CMakeLists.txt

#include "red_black_tree.hpp"

#include "print.hpp"

#include <optional>
#include <string>

namespace
{

const char *color_name(const rbt::Node<int> *n)
{
    return rbt::is_black(n) ? "B" : "R";
}

void show(const std::string &label, const rbt::RBTree<int> &tree)
{
    const auto *r = tree.root();
    util::println("{}: {}  size={} height={} black-height={} valid={}",
                  label, tree.to_string(), tree.size(), tree.height(),
                  tree.black_height(), tree.validate());
    if (r != nullptr)
        util::println("    root {}({})", r->value, color_name(r));
}

} // namespace

int main()
{
    util::println("==== Red-Black Tree walkthrough ====");

    // ── 1. straight-line insert forces one rotation ──────────────────────
    {
        rbt::RBTree<int> tree;
        for (int v : {10, 20, 30})
            tree.insert(v);
        show("insert 10,20,30", tree);
    }

    // ── 2. ascending insert stays balanced ───────────────────────────────
    {
        rbt::RBTree<int> tree;
        for (int v = 1; v <= 7; ++v)
            tree.insert(v);
        show("insert 1..7", tree);
    }

    // ── 3. two-child removal through the in-order successor ──────────────
    {
        rbt::RBTree<int> tree;
        for (int v : {5, 3, 8, 1, 4, 7, 9})
            tree.insert(v);
        show("build {5,3,8,1,4,7,9}", tree);

        auto removed = tree.remove(3);
        util::println("remove 3 -> {}", removed ? std::to_string(*removed) : "not found");
        show("after remove 3", tree);

        std::string in_order;
        tree.for_each_in_order([&in_order](int v)
                               { in_order += std::to_string(v) + " "; });
        util::println("    in-order: {}", in_order);

        util::println("remove 42 -> {}", tree.remove(42) ? "removed" : "not found");
    }

    // ── 4. rejected inserts ──────────────────────────────────────────────
    {
        rbt::RBTree<int> tree;
        tree.insert(1);
        try
        {
            tree.insert(1);
        }
        catch (const rbt::DuplicateValue &e)
        {
            util::println("insert 1 twice -> {}", e.what());
        }

        try
        {
            tree.insert_optional(std::nullopt);
        }
        catch (const rbt::NullValue &e)
        {
            util::println("insert nothing -> {}", e.what());
        }
    }

    return 0;
}
