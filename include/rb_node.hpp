// rb_node.hpp
// Node record and the rotation primitive of the red-black tree.
// -----------------------------------------------------------
// * Children are plain pointers owned by the enclosing RBTree; the parent
//   link is a non-owning back reference (nullptr for the root).
// * Absent children are never materialised.  They count as BLACK nil
//   leaves, which is what is_black()/is_red() encode.
// * rotate() is the only structural primitive used by both fix-ups.  It
//   never touches colours and never writes a root slot: when the promoted
//   node ends up without a parent the caller adopts it as the new root.

#ifndef RBT_RB_NODE_HPP
#define RBT_RB_NODE_HPP

#include <cstdint>
#include <queue>
#include <sstream>
#include <string>
#include <utility>

#include "rb_errors.hpp"

namespace rbt
{

    /*-------------------------------------------------------------------------
     *  enum Color
     *-------------------------------------------------------------------------
     *  • Each node is either RED or BLACK; these colours encode the RB-tree
     *    invariants that keep the structure balanced.
     *  • Backed by uint8_t to keep the node footprint small.
     *-------------------------------------------------------------------------*/
    enum class Color : uint8_t
    {
        RED,
        BLACK
    };

    /*-------------------------------------------------------------------------
     *  struct Node<T>
     *-------------------------------------------------------------------------
     *  value        – stored element; ordering governed by the tree's Compare.
     *  color        – RED or BLACK, defaults to RED (newly inserted nodes).
     *  parent,left,right – raw pointers forming the usual binary-tree links.
     *-------------------------------------------------------------------------*/
    template <typename T>
    struct Node
    {
        T value;
        Color color{Color::RED};

        Node *parent{nullptr};
        Node *left{nullptr};
        Node *right{nullptr};

        explicit Node(const T &v, Color c = Color::RED) : value(v), color(c) {}
        explicit Node(T &&v, Color c = Color::RED) : value(std::move(v)), color(c) {}

        /* The root is neither a left nor a right child. */
        bool is_left_child() const noexcept
        {
            return parent != nullptr && parent->left == this;
        }

        bool is_right_child() const noexcept
        {
            return parent != nullptr && parent->right == this;
        }

        bool is_leaf() const noexcept { return left == nullptr && right == nullptr; }
    };

    /* nullptr stands for a nil leaf, which is BLACK. */
    template <typename T>
    inline bool is_black(const Node<T> *n) noexcept
    {
        return n == nullptr || n->color == Color::BLACK;
    }

    template <typename T>
    inline bool is_red(const Node<T> *n) noexcept
    {
        return n != nullptr && n->color == Color::RED;
    }

    /*===========================================================================
     *  Tree Rotation
     *===========================================================================
     *  rotate(child, parent) exchanges the positions of an adjacent pair while
     *  preserving in-order key ordering.
     *
     *  child == parent->left  → RIGHT rotation
     *  child == parent->right → LEFT rotation
     *
     *          g              g
     *         /              /
     *        p              c
     *       / \    --->    / \
     *      c   γ          α   p
     *     / \                / \
     *    α   β              β   γ
     *
     *  Left rotation is the mirror image.  Anything else throws
     *  InvalidRelationship before a single link is written.
     *
     *  Returns the promoted child.  If child->parent is nullptr afterwards the
     *  pair used to sit at the root and the caller must update its root slot.
     *===========================================================================*/
    template <typename T>
    Node<T> *rotate(Node<T> *child, Node<T> *parent)
    {
        if (child == nullptr || parent == nullptr || child->parent != parent)
            throw InvalidRelationship();

        Node<T> *grand = parent->parent;

        if (parent->left == child) // RIGHT rotation
        {
            /* Step 1: child's RIGHT subtree (β) becomes parent's LEFT subtree */
            parent->left = child->right;
            if (child->right != nullptr)
                child->right->parent = parent;

            /* Step 2: put parent on child's RIGHT */
            child->right = parent;
        }
        else if (parent->right == child) // LEFT rotation
        {
            parent->right = child->left;
            if (child->left != nullptr)
                child->left->parent = parent;

            child->left = parent;
        }
        else
        {
            // back link says "parent" but neither child slot agrees
            throw InvalidRelationship();
        }

        /* Step 3: link grand-parent to child */
        child->parent = grand;
        if (grand != nullptr)
        {
            if (grand->left == parent)
                grand->left = child;
            else
                grand->right = child;
        }
        parent->parent = child;

        return child;
    }

    /*-------------------------------------------------------------------------
     *  level_order_string
     *-------------------------------------------------------------------------
     *  Breadth-first rendering of the subtree rooted at `n`:
     *  "[5, 3, 8, 1, 4, 7, 9]".  Values are written with operator<<.
     *  A null subtree renders as "[]".
     *-------------------------------------------------------------------------*/
    template <typename T>
    std::string level_order_string(const Node<T> *n)
    {
        std::ostringstream out;
        out << '[';

        std::queue<const Node<T> *> q;
        if (n != nullptr)
            q.push(n);

        while (!q.empty())
        {
            const Node<T> *next = q.front();
            q.pop();
            if (next->left != nullptr)
                q.push(next->left);
            if (next->right != nullptr)
                q.push(next->right);

            out << next->value;
            if (!q.empty())
                out << ", ";
        }

        out << ']';
        return out.str();
    }

} // namespace rbt

#endif // RBT_RB_NODE_HPP
