// rb_errors.hpp
// Exceptions raised by the red-black tree.
// -----------------------------------------------------------
// * NullValue / DuplicateValue are precondition failures of insert();
//   both are thrown before the tree is touched.
// * InvalidRelationship means rotate() was handed two nodes that are not
//   parent and child.  It signals a broken algorithm, not bad user input.
// * Removing a value that is not stored is NOT an error: remove() simply
//   returns std::nullopt.

#ifndef RBT_RB_ERRORS_HPP
#define RBT_RB_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace rbt
{

    /* Common base so callers can catch every tree failure in one place. */
    class TreeError : public std::logic_error
    {
    public:
        explicit TreeError(const std::string &what) : std::logic_error(what) {}
    };

    class NullValue : public TreeError
    {
    public:
        NullValue() : TreeError("red-black tree cannot store an absent value") {}
    };

    class DuplicateValue : public TreeError
    {
    public:
        DuplicateValue() : TreeError("red-black tree already contains that value") {}
    };

    class InvalidRelationship : public TreeError
    {
    public:
        InvalidRelationship()
            : TreeError("rotate(): child and parent are not related") {}
    };

} // namespace rbt

#endif // RBT_RB_ERRORS_HPP
