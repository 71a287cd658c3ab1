#include "arbor/route-tree.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "arbor/http-request.hpp"
#include "arbor/path-handlers.hpp"
#include "arbor/router-errors.hpp"
#include "arbor/split-segments.hpp"
#include "arbor/vector.hpp"

namespace arbor {

namespace {

constexpr std::size_t kDumpIndent = 2;

bool IsParamSegment(std::string_view segment) noexcept {
  return segment.size() > 1U && segment.front() == RouteTree::kParamSigil;
}

RouteTree::Node& EnsureLiteralChild(RouteTree::Node& node, std::string_view segment) {
  const auto it = node.literalChildren.find(segment);
  if (it != node.literalChildren.end()) {
    return *it->second;
  }
  auto child = std::make_unique<RouteTree::Node>();
  child->segment.assign(segment);
  const std::string_view key = child->segment;
  return *node.literalChildren.emplace(key, std::move(child)).first->second;
}

void DumpNode(std::string& out, const RouteTree::Node& node, std::string_view label, std::size_t depth) {
  out.append(node.hasHandler() ? "* " : "  ");
  out.append(depth * kDumpIndent, ' ');
  out.append(label);
  out.push_back('\n');

  vector<const RouteTree::Node*> children;
  children.reserve(static_cast<decltype(children)::size_type>(node.literalChildren.size()));
  for (const auto& [segment, child] : node.literalChildren) {
    children.push_back(child.get());
  }
  std::ranges::sort(children, [](const RouteTree::Node* lhs, const RouteTree::Node* rhs) {
    return lhs->segment < rhs->segment;
  });

  std::string childLabel;
  for (const RouteTree::Node* child : children) {
    childLabel.assign(1, RouteTree::kSeparator);
    childLabel.append(child->segment);
    DumpNode(out, *child, childLabel, depth + 1U);
  }
  if (node.paramChild) {
    childLabel.assign(1, RouteTree::kSeparator);
    childLabel.push_back(RouteTree::kParamSigil);
    childLabel.append(node.paramChild->segment);
    DumpNode(out, *node.paramChild, childLabel, depth + 1U);
  }
}

}  // namespace

const RouteTree::Node* RouteTree::Node::literalChild(std::string_view segment) const noexcept {
  const auto it = literalChildren.find(segment);
  return it == literalChildren.end() ? nullptr : it->second.get();
}

void RouteTree::ValidatePath(std::string_view path) {
  if (path.empty() || path.front() != kSeparator) {
    throw invalid_path("Path '{}' does not begin with a leading slash", path);
  }
}

bool RouteTree::insert(std::string_view path, std::shared_ptr<const RequestHandler> handler) {
  ValidatePath(path);

  Node* node = &_root;
  ForEachSegment(path.substr(1), kSeparator, [&node, path](std::string_view segment) {
    if (IsParamSegment(segment)) {
      const std::string_view name = segment.substr(1);
      if (!node->paramChild) {
        node->paramChild = std::make_unique<Node>();
        node->paramChild->segment.assign(name);
      } else if (node->paramChild->segment != name) {
        throw route_conflict("Path param ':{}' of '{}' already defined as ':{}'", name, path,
                             node->paramChild->segment);
      }
      node = node->paramChild.get();
    } else {
      node = &EnsureLiteralChild(*node, segment);
    }
    return true;
  });

  const bool replaced = node->hasHandler();
  node->handler = std::move(handler);
  return replaced;
}

RouteTree::WalkResult RouteTree::walk(std::string_view path, PathParams& pathParams) const {
  const char* pathEnd = path.data() + path.size();

  WalkResult result;
  const Node* node = &_root;
  bool lastSegmentUnmatched = false;

  const bool allConsumed = ForEachSegment(path, kSeparator, [&](std::string_view segment) {
    result.previous = node;
    const Node* child = node->literalChild(segment);
    if (child != nullptr) {
      node = child;
      return true;
    }
    if (node->paramChild && !segment.empty()) {
      pathParams[node->paramChild->segment] = segment;
      node = node->paramChild.get();
      return true;
    }
    lastSegmentUnmatched = segment.data() + segment.size() == pathEnd;
    return false;
  });

  if (allConsumed) {
    result.node = node;
    result.outcome = node->hasHandler() ? WalkResult::Outcome::Matched : WalkResult::Outcome::Boundary;
  } else if (lastSegmentUnmatched) {
    result.outcome = WalkResult::Outcome::Boundary;
  }
  return result;
}

void RouteTree::dump(std::string& out, std::string_view label) const { DumpNode(out, _root, label, 0); }

}  // namespace arbor
