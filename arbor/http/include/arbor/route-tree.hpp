#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "arbor/flat-hash-map.hpp"
#include "arbor/http-request.hpp"
#include "arbor/path-handlers.hpp"

namespace arbor {

// Tree of the routes registered for one HTTP method, with one edge per path segment.
//
// A segment starting with ':' followed by at least one character is a named parameter: it matches any non empty
// request segment for which no literal edge exists, and captures it under that name. A node has at most one
// parameter child, and its name is fixed by the first route registering it.
// Trailing and consecutive slashes produce literal edges keyed by the empty segment, so "/foo" and "/foo/" are two
// distinct routes.
class RouteTree {
 public:
  static constexpr char kSeparator = '/';
  static constexpr char kParamSigil = ':';

  struct Node {
    // Returns the literal child for 'segment', or nullptr if there is none.
    [[nodiscard]] const Node* literalChild(std::string_view segment) const noexcept;

    [[nodiscard]] bool hasHandler() const noexcept { return handler != nullptr; }

    // Keys view the 'segment' member of their child node, which never moves.
    flat_hash_map<std::string_view, std::unique_ptr<Node>> literalChildren;
    std::unique_ptr<Node> paramChild;
    // Literal segment for a literal child, parameter name (without sigil) for a parameter child.
    std::string segment;
    // nullptr when no route terminates at this node.
    std::shared_ptr<const RequestHandler> handler;
  };

  struct WalkResult {
    enum class Outcome : std::int8_t {
      Matched,  // all segments consumed, the reached node has a handler
      DeadEnd,  // a segment before the last one could not be consumed
      Boundary  // all segments but possibly the last one consumed, and no handler found
    };

    // Node reached after the last segment, nullptr if the last segment could not be consumed.
    const Node* node{nullptr};
    // Node from which the last hop was made (or attempted).
    const Node* previous{nullptr};
    Outcome outcome{Outcome::DeadEnd};
  };

  RouteTree() = default;

  RouteTree(const RouteTree&) = delete;
  RouteTree& operator=(const RouteTree&) = delete;

  RouteTree(RouteTree&&) noexcept = default;
  RouteTree& operator=(RouteTree&&) noexcept = default;

  ~RouteTree() = default;

  // Throws invalid_path if 'path' does not start with '/'.
  static void ValidatePath(std::string_view path);

  // Binds 'handler' (possibly nullptr) to 'path', creating the missing nodes.
  // The last registration of a given path wins.
  // Returns true if a previously bound handler has been replaced.
  // Throws invalid_path if 'path' does not start with '/' (the tree is not modified), and route_conflict if a
  // parameter segment has a different name than the parameter already bound at the same position (nodes created
  // before the conflicting segment are kept).
  bool insert(std::string_view path, std::shared_ptr<const RequestHandler> handler);

  // Walks the segments of 'path' (given without its leading '/') from the root.
  // Literal edges are preferred over the parameter edge, and there is no backtracking.
  // Each parameter edge taken stores its captured segment in 'pathParams'.
  [[nodiscard]] WalkResult walk(std::string_view path, PathParams& pathParams) const;

  [[nodiscard]] const Node& root() const noexcept { return _root; }

  // Appends to 'out' one line per node, '*' marking nodes with a handler, with a 2 spaces indentation per level.
  // The root line shows 'label'. Literal children are sorted by segment, the parameter child comes last.
  void dump(std::string& out, std::string_view label) const;

 private:
  Node _root;
};

}  // namespace arbor
