#pragma once

/**
 * @file cycle_detector.hpp
 * @brief Iterative depth-first cycle search over an adjacency map
 */

#include <algorithm>
#include <map>
#include <set>
#include <vector>

namespace hexarch::query::detail {

/**
 * Find the cycles reachable from every key of @p adjacency.
 *
 * Roots are visited in key order and every node is expanded once. Reaching a
 * node that is on the current path records the path from that node's first
 * occurrence, closed by repeating the node.
 */
template <typename Key>
[[nodiscard]] std::vector<std::vector<Key>> find_cycles(const std::map<Key, std::set<Key>>& adjacency)
{
    using Successors = std::set<Key>;
    struct Frame
    {
        Key node;
        typename Successors::const_iterator next;
        typename Successors::const_iterator end;
    };

    static const Successors kNoSuccessors;
    const auto successors_of = [&](const Key& key) -> const Successors& {
        auto it = adjacency.find(key);
        return it == adjacency.end() ? kNoSuccessors : it->second;
    };

    std::set<Key> visited;
    std::set<Key> on_stack;
    std::vector<Key> path;
    std::vector<Frame> stack;
    std::vector<std::vector<Key>> cycles;

    const auto push = [&](const Key& key) {
        visited.insert(key);
        on_stack.insert(key);
        path.push_back(key);
        const auto& successors = successors_of(key);
        stack.push_back(Frame{.node = key, .next = successors.begin(), .end = successors.end()});
    };

    for (const auto& [root, _] : adjacency) {
        if (visited.contains(root)) {
            continue;
        }
        push(root);
        while (!stack.empty()) {
            auto& frame = stack.back();
            if (frame.next == frame.end) {
                on_stack.erase(frame.node);
                path.pop_back();
                stack.pop_back();
                continue;
            }
            const Key dependency = *frame.next;
            ++frame.next;
            if (on_stack.contains(dependency)) {
                auto first = std::ranges::find(path, dependency);
                std::vector<Key> cycle(first, path.end());
                cycle.push_back(dependency);
                cycles.push_back(std::move(cycle));
            } else if (!visited.contains(dependency)) {
                push(dependency);
            }
        }
    }
    return cycles;
}

}  // namespace hexarch::query::detail
