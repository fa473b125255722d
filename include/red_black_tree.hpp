// red_black_tree.hpp
// Ordered set backed by a red-black tree.
// -----------------------------------------------------------
// * Stores unique values of type T ordered by Compare (std::less<T> by
//   default).  Height stays within 2*log2(n+1) whatever the insertion order.
// * Single-threaded: there is no internal locking.  Share a tree between
//   threads only behind an external mutex.
// * Both fix-ups are iterative ascending loops (CLRS §13.3 / §13.4) and use
//   rbt::rotate() as their only restructuring primitive.
// * Absent children are nullptr and count as BLACK; there is no NIL node.
//
//   Build:  header-only, C++17.  See CMakeLists.txt for the demo and tests.

#ifndef RBT_RED_BLACK_TREE_HPP
#define RBT_RED_BLACK_TREE_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rb_errors.hpp"
#include "rb_node.hpp"

namespace rbt
{

    template <typename T, typename Compare = std::less<T>>
    class RBTree
    {
    public:
        /* Type alias for brevity.  All internal helpers refer to nodes via NodeT */
        using NodeT = Node<T>;
        using value_type = T;
        using size_type = std::size_t;

        RBTree() = default;

        explicit RBTree(const Compare &c) : comp(c) {}

        /*───────────────────────────────────────────────────────────────────────────
          Destructor
          ──────────
          • Recursively delete every node via destroy_rec() (post-order).
         ──────────────────────────────────────────────────────────────────────────*/
        ~RBTree()
        {
            destroy_rec(root_);
        }

        /*───────────────────────────────────────────────────────────────────────────
          Rule of five
          ────────────
          • The tree owns raw nodes; a shallow copy would double-delete them, so
            copy operations are deleted.
          • Moving hands the whole node graph over and leaves the source empty.
         ──────────────────────────────────────────────────────────────────────────*/
        RBTree(const RBTree &) = delete;
        RBTree &operator=(const RBTree &) = delete;

        RBTree(RBTree &&other) noexcept
            : root_(std::exchange(other.root_, nullptr)),
              size_(std::exchange(other.size_, 0)),
              comp(std::move(other.comp))
        {
        }

        RBTree &operator=(RBTree &&other) noexcept
        {
            if (this != &other)
            {
                destroy_rec(root_);
                root_ = std::exchange(other.root_, nullptr);
                size_ = std::exchange(other.size_, 0);
                comp = std::move(other.comp);
            }
            return *this;
        }

        // ────────────────────────────────────────────────────────────────────────
        //  INSERT
        //
        //  • Descend from the root: less → LEFT, greater → RIGHT, equal →
        //    DuplicateValue.  The descent finishes before anything is
        //    allocated, so a rejected insert leaves the tree untouched.
        //  • The new node is attached as a RED leaf and insert_fixup() restores
        //    the invariants; the root is forced BLACK afterwards.
        //
        //  Complexity: O(log n) comparisons, O(1) rotations.
        // ────────────────────────────────────────────────────────────────────────
        void insert(const T &v) { insert_impl(v); }

        void insert(T &&v) { insert_impl(std::move(v)); }

        /* Entry point for callers that may hold no value at all.  Kept apart
         * from insert() so arguments converting to T never also match here. */
        void insert_optional(const std::optional<T> &v)
        {
            if (!v)
                throw NullValue();
            insert_impl(*v);
        }

        // ────────────────────────────────────────────────────────────────────────
        //  REMOVE
        //
        //  The algorithm follows CLRS “RB-DELETE”:
        //      1.  Find node z holding v.  Not found → std::nullopt (no error).
        //      2.  Ordinary BST delete using transplant().  y is the node that
        //          physically leaves its position: z itself, or z’s in-order
        //          successor when z has two children.
        //      3.  If y was BLACK a path lost one black node; delete_fixup()
        //          starts at the position y vacated.  That position may be an
        //          absent child, so it is tracked as the pair (x, x_parent).
        //
        //  Returns the removed value.
        // ────────────────────────────────────────────────────────────────────────
        std::optional<T> remove(const T &v)
        {
            NodeT *z = search(root_, v);
            if (z == nullptr)
                return std::nullopt;

            NodeT *y = z;
            NodeT *x = nullptr;
            NodeT *x_parent = nullptr;
            Color y_original = y->color;

            /* z has < 2 children → splice its only child (or nothing) in */
            if (z->left == nullptr)
            {
                x = z->right;
                x_parent = z->parent;
                transplant(z, z->right);
            }
            else if (z->right == nullptr)
            {
                x = z->left;
                x_parent = z->parent;
                transplant(z, z->left);
            }

            /* z has TWO children → the in-order successor takes its place */
            else
            {
                // successor has no left child
                y = minimum(z->right);
                y_original = y->color;
                x = y->right;

                if (y->parent == z)
                {
                    x_parent = y;
                }
                else
                {
                    // y’s right subtree moves into y’s old slot (always a left slot)
                    x_parent = y->parent;
                    transplant(y, y->right);
                    y->right = z->right;
                    y->right->parent = y;
                }

                transplant(z, y);
                y->left = z->left;
                y->left->parent = y;
                y->color = z->color; // y adopts z’s original colour
            }

            std::optional<T> removed(std::move(z->value));
            delete z;
            --size_;

            if (y_original == Color::BLACK)
                delete_fixup(x, x_parent);

            return removed;
        }

        /* Node holding v, or nullptr.  Invalidated by any later remove of v. */
        const NodeT *search(const T &v) const { return search(root_, v); }

        bool contains(const T &v) const { return search(root_, v) != nullptr; }

        std::optional<T> min() const
        {
            if (root_ == nullptr)
                return std::nullopt;
            return minimum(root_)->value;
        }

        std::optional<T> max() const
        {
            if (root_ == nullptr)
                return std::nullopt;
            return maximum(root_)->value;
        }

        /* Level-order rendering, e.g. "[5, 3, 8, 1, 4, 7, 9]"; "[]" when empty. */
        std::string to_string() const { return level_order_string(root_); }

        /* Visits every value in ascending order. */
        template <typename Visitor>
        void for_each_in_order(Visitor &&visit) const
        {
            in_order_rec(root_, visit);
        }

        std::vector<T> in_order() const
        {
            std::vector<T> out;
            out.reserve(size_);
            for_each_in_order([&out](const T &v)
                              { out.push_back(v); });
            return out;
        }

        size_type size() const noexcept { return size_; }
        bool empty() const noexcept { return root_ == nullptr; }

        void clear() noexcept
        {
            destroy_rec(root_);
            root_ = nullptr;
            size_ = 0;
        }

        const NodeT *root() const noexcept { return root_; }

        /* Nodes on the longest root-to-leaf path; 0 for an empty tree. */
        int height() const { return height_rec(root_); }

        /* Black-height of the root, or -1 when paths disagree. */
        int black_height() const { return black_height_rec(root_); }

        bool validate() const
        {
            if (root_ == nullptr)
                return size_ == 0;
            if (root_->parent != nullptr || root_->color != Color::BLACK)
                return false;

            int bh = -1;
            size_type count = 0;
            return validate_rec(root_, nullptr, nullptr, 0, bh, count) &&
                   count == size_;
        }

    protected:
        /*───────────────────────────────────────────────────────────────────────────
          rotate(child, parent)
          ---------------------
          Tree-level wrapper around rbt::rotate(): performs the rotation and
          adopts the promoted child as root when the pair sat at the top.
          Throws InvalidRelationship (tree unchanged) for unrelated nodes.
        ───────────────────────────────────────────────────────────────────────────*/
        void rotate(NodeT *child, NodeT *parent)
        {
            if (rbt::rotate(child, parent)->parent == nullptr)
                root_ = child;
        }

        NodeT *mutable_root() noexcept { return root_; }

    private:
        /*────────────────────────────────────────────────────────────────────────────
         *  Core data members of RBTree
         *───────────────────────────────────────────────────────────────────────────*/

        /* Top of the tree, nullptr when empty.  Only the tree writes it: insert,
         * transplant and the rotate() wrapper update it when the root changes. */
        NodeT *root_{nullptr};

        size_type size_{0};

        /* Strict total order on T.  Equality is !comp(a,b) && !comp(b,a). */
        Compare comp;

        void destroy_rec(NodeT *n) noexcept
        {
            if (n == nullptr)
                return;

            destroy_rec(n->left);
            destroy_rec(n->right);
            delete n;
        }

        template <typename U>
        void insert_impl(U &&v)
        {
            NodeT *y = nullptr;  // will track the parent pointer
            NodeT *x = root_;    // traversal cursor
            bool as_left = false;

            while (x != nullptr)
            {
                y = x;
                if (comp(v, x->value))
                {
                    as_left = true;
                    x = x->left;
                }
                else if (comp(x->value, v))
                {
                    as_left = false;
                    x = x->right;
                }
                else
                {
                    throw DuplicateValue();
                }
            }

            NodeT *z = new NodeT(std::forward<U>(v));
            z->parent = y;
            if (y == nullptr) // tree was empty → z becomes root
                root_ = z;
            else if (as_left)
                y->left = z;
            else
                y->right = z;
            ++size_;

            insert_fixup(z);
        }

        /* --------------------------------------------------------------------------
         *  RB-TREE INSERT FIX-UP
         *
         *  z :  The newly inserted node (RED).  Only “a RED node has a RED
         *       parent” can be violated; black-height is untouched by a red leaf.
         *
         *  While z’s parent is RED (so the grand-parent exists and is BLACK):
         *     Uncle RED         → recolour parent & uncle BLACK, gp RED and
         *                         continue from gp.
         *     Uncle BLACK and
         *     z is an inner child (zig-zag)
         *                       → rotate z over its parent; the old parent is
         *                         now the outer child.
         *     Uncle BLACK and
         *     z is an outer child (straight line)
         *                       → parent BLACK, gp RED, rotate parent over gp.
         *
         *  The first branch handles “parent is a LEFT child”; the `else`
         *  mirrors it.
         * -------------------------------------------------------------------------- */
        void insert_fixup(NodeT *z)
        {
            z->color = Color::RED;

            while (z != root_ && is_red(z->parent))
            {
                NodeT *p = z->parent;
                NodeT *g = p->parent; // p is RED, hence not the root

                /* ================================================================
                 *   PARENT IS LEFT CHILD
                 * ================================================================ */
                if (p == g->left)
                {
                    NodeT *uncle = g->right;

                    if (is_red(uncle))
                    {
                        //        gp(B)            gp(R)
                        //       /     \          /     \
                        //   p(R)      u(R) →  p(B)     u(B)
                        //   /                  /
                        // z(R)               z(R)
                        p->color = Color::BLACK;
                        uncle->color = Color::BLACK;
                        g->color = Color::RED;
                        z = g;
                    }
                    else
                    {
                        if (z == p->right)
                        {
                            rotate(z, p);
                            z = p;
                            p = z->parent;
                        }

                        p->color = Color::BLACK;
                        g->color = Color::RED;
                        rotate(p, g);
                    }
                }
                /* ================================================================
                 *   PARENT IS RIGHT CHILD  (mirror of above)
                 * ================================================================ */
                else
                {
                    NodeT *uncle = g->left;

                    if (is_red(uncle))
                    {
                        p->color = Color::BLACK;
                        uncle->color = Color::BLACK;
                        g->color = Color::RED;
                        z = g;
                    }
                    else
                    {
                        if (z == p->left)
                        {
                            rotate(z, p);
                            z = p;
                            p = z->parent;
                        }

                        p->color = Color::BLACK;
                        g->color = Color::RED;
                        rotate(p, g);
                    }
                }
            }

            // a rotation may have promoted a RED node into the root slot
            root_->color = Color::BLACK;
        }

        // ─────────────────────────────────────────────────────────────────────────────
        //   transplant(u, v)
        //   --------------------------------------------------------------------------
        //   Replaces the subtree rooted at `u` with the subtree rooted at `v`
        //   (which may be nullptr) on whichever side `u` hung.  Colours are not
        //   modified here.
        // ─────────────────────────────────────────────────────────────────────────────
        void transplant(NodeT *u, NodeT *v) noexcept
        {
            if (u->parent == nullptr)
                root_ = v;
            else if (u == u->parent->left)
                u->parent->left = v;
            else
                u->parent->right = v;

            if (v != nullptr)
                v->parent = u->parent;
        }

        /* Left-most node of the subtree; `x` must not be nullptr. */
        static NodeT *minimum(NodeT *x) noexcept
        {
            while (x->left != nullptr)
                x = x->left;
            return x;
        }

        static NodeT *maximum(NodeT *x) noexcept
        {
            while (x->right != nullptr)
                x = x->right;
            return x;
        }

        NodeT *search(NodeT *n, const T &v) const
        {
            while (n != nullptr)
            {
                if (comp(v, n->value))
                    n = n->left;
                else if (comp(n->value, v))
                    n = n->right;
                else
                    return n;
            }
            return nullptr;
        }

        /* --------------------------------------------------------------------------
         * Fix-up after RB-tree deletion
         *
         *  x        – the node that took the removed node’s place (may be nullptr)
         *  parent   – x’s parent; needed because an absent x has no back link
         *
         *  x carries an extra “double-black” that must be pushed upward or
         *  resolved locally.  w is x’s sibling; it always exists while the
         *  deficiency does, because the sibling side still holds a black node.
         *
         *  Case 1:  w is RED                    -> recolour & rotate to make w BLACK
         *  Case 2:  w BLACK, both nephews BLACK -> w RED, move deficiency to parent
         *  Case 3:  w BLACK, near nephew RED,   -> rotate near nephew over w to
         *           far nephew BLACK               reach Case 4
         *  Case 4:  w BLACK, far nephew RED     -> recolour, rotate w over parent,
         *                                          done
         *  Absent nephews are BLACK.  The “left” branch covers x as a left
         *  child; the “else” branch is the mirror.
         * -------------------------------------------------------------------------- */
        void delete_fixup(NodeT *x, NodeT *parent)
        {
            while (x != root_ && is_black(x))
            {
                // ─────────────────────────  x is LEFT child  ────────────────────────
                if (x == parent->left)
                {
                    NodeT *w = parent->right;

                    /* ---------------- Case 1: sibling is RED -------------------- */
                    if (is_red(w))
                    {
                        w->color = Color::BLACK;
                        parent->color = Color::RED;
                        rotate(w, parent);
                        w = parent->right; // new sibling after rotation
                    }

                    /* ------------ Case 2: sibling black, both nephews black ------- */
                    if (is_black(w->left) && is_black(w->right))
                    {
                        w->color = Color::RED;
                        x = parent;
                        parent = x->parent;
                    }
                    else
                    {
                        /* ---------- Case 3: far nephew black ---------------------- */
                        if (is_black(w->right))
                        {
                            //   p(?)               p(?)
                            //  /    \     --->    /    \
                            // x(DB)  w(B)        x(DB)  a(B)
                            //        /   \                 \
                            //      a(R)  b(B)              w(R)
                            //                                \
                            //                                b(B)
                            w->left->color = Color::BLACK;
                            w->color = Color::RED;
                            rotate(w->left, w);
                            w = parent->right;
                        }

                        /* ------------------- Case 4: far nephew RED --------------- */
                        //     p(?)                      w(?)
                        //    /    \     rotate         /    \
                        //   x(DB)  w(B)   --->        p(B)   c(B)
                        //          /  \              /   \
                        //         b    c(R)        x(B)   b
                        w->color = parent->color;
                        parent->color = Color::BLACK;
                        w->right->color = Color::BLACK;
                        rotate(w, parent);
                        x = root_; // loop will terminate
                        parent = nullptr;
                    }
                }
                // ────────────────────────  x is RIGHT child (mirror)  ──────────────
                else
                {
                    NodeT *w = parent->left;

                    if (is_red(w))
                    {
                        w->color = Color::BLACK;
                        parent->color = Color::RED;
                        rotate(w, parent);
                        w = parent->left;
                    }

                    if (is_black(w->right) && is_black(w->left))
                    {
                        w->color = Color::RED;
                        x = parent;
                        parent = x->parent;
                    }
                    else
                    {
                        if (is_black(w->left))
                        {
                            w->right->color = Color::BLACK;
                            w->color = Color::RED;
                            rotate(w->right, w);
                            w = parent->left;
                        }

                        w->color = parent->color;
                        parent->color = Color::BLACK;
                        w->left->color = Color::BLACK;
                        rotate(w, parent);
                        x = root_;
                        parent = nullptr;
                    }
                }
            }

            // clear the extra black on x (a RED x absorbs it here)
            if (x != nullptr)
                x->color = Color::BLACK;
        }

        template <typename Visitor>
        static void in_order_rec(const NodeT *n, Visitor &visit)
        {
            if (n == nullptr)
                return;
            in_order_rec(n->left, visit);
            visit(n->value);
            in_order_rec(n->right, visit);
        }

        static int height_rec(const NodeT *n)
        {
            if (n == nullptr)
                return 0;
            return 1 + std::max(height_rec(n->left), height_rec(n->right));
        }

        static int black_height_rec(const NodeT *n)
        {
            if (n == nullptr)
                return 0;

            int l = black_height_rec(n->left);
            int r = black_height_rec(n->right);
            if (l < 0 || r < 0 || l != r)
                return -1;
            return l + (n->color == Color::BLACK ? 1 : 0);
        }

        /*────────────────────────────────────────────────────────────────────────────
          validate_rec
          ─────────────
          Checks the subtree rooted at `n` (never nullptr here).

          lo, hi   : tightest bounds inherited from the ancestors (nullptr = none);
                     every value must lie strictly between them.
          blacks   : BLACK nodes seen on the path above `n`.
          target   : OUT.  Black count of the first nil leaf reached; every
                     other nil leaf must match it.
          count    : OUT.  Running node count, compared with size_ by validate().

          Properties verified
          -------------------
          • BST order (against the bounds, so cousins are covered too)
          • parent/child links agree
          • a RED node has no RED child
          • uniform black-height
         ───────────────────────────────────────────────────────────────────────────*/
        bool validate_rec(const NodeT *n, const T *lo, const T *hi,
                          int blacks, int &target, size_type &count) const
        {
            ++count;

            if (lo != nullptr && !comp(*lo, n->value))
                return false;
            if (hi != nullptr && !comp(n->value, *hi))
                return false;

            if (n->color == Color::BLACK)
                ++blacks;
            else if (is_red(n->left) || is_red(n->right))
                return false;

            const NodeT *kids[2] = {n->left, n->right};
            for (const NodeT *kid : kids)
            {
                if (kid == nullptr)
                {
                    // nil leaf: record black-height once, compare afterwards
                    if (target == -1)
                        target = blacks;
                    if (blacks != target)
                        return false;
                }
                else if (kid->parent != n)
                {
                    return false;
                }
            }

            return (n->left == nullptr ||
                    validate_rec(n->left, lo, &n->value, blacks, target, count)) &&
                   (n->right == nullptr ||
                    validate_rec(n->right, &n->value, hi, blacks, target, count));
        }
    };

} // namespace rbt

#endif // RBT_RED_BLACK_TREE_HPP
