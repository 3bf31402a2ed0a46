/***************************************************************************
 * MIT License                                                             *
 *                                                                         *
 * Copyright (C) by ETHZ/SED                                               *
 *                                                                         *
 * Permission is hereby granted, free of charge, to any person obtaining a *
 * copy of this software and associated documentation files (the           *
 * “Software”), to deal in the Software without restriction, including     *
 * without limitation the rights to use, copy, modify, merge, publish,     *
 * distribute, sublicense, and/or sell copies of the Software, and to      *
 * permit persons to whom the Software is furnished to do so, subject to   *
 * the following conditions:                                               *
 *                                                                         *
 * The above copyright notice and this permission notice shall be          *
 * included in all copies or substantial portions of the Software.         *
 *                                                                         *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND,         *
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF      *
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.  *
 * IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY    *
 * CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,    *
 * TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE       *
 * SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.                  *
 *                                                                         *
 *   Developed by Luca Scarabello <luca.scarabello@sed.ethz.ch>            *
 ***************************************************************************/

#ifndef __MEL_KDTREE_H__
#define __MEL_KDTREE_H__

#include "utils.h"

#include <algorithm>
#include <limits>
#include <numeric>
#include <queue>
#include <stdexcept>
#include <vector>

namespace MEL {

/*
 * kd-tree over hypocenters (latitude, longitude, depth) supporting
 * k-nearest-neighbour queries with a distance cutoff. Distances are
 * hypocentral distances in km.
 */
template <typename T> class KDTree
{
public:
  struct Point
  {
    double latitude;
    double longitude;
    double depth;
    T data;
  };

  struct Neighbour
  {
    const Point *point;
    double distance;
  };

  KDTree() = default;

  explicit KDTree(const std::vector<Point> &points) : _points(points)
  {
    _nodes.resize(_points.size());

    for (const Point &p : _points) _maxDepth = std::max(_maxDepth, p.depth);

    std::vector<size_t> indices(_points.size());
    std::iota(std::begin(indices), std::end(indices), 0);

    _root = buildRecursive(indices.data(), _points.size(), 0);
  }

  // non-copyable: nodes point into each other
  KDTree(const KDTree &)            = delete;
  KDTree &operator=(const KDTree &) = delete;

  size_t size() const { return _points.size(); }

  /*
   * Return up to `k` points within `maxDistance` km from the query
   * position, sorted by increasing distance. Points for which `accept`
   * returns false are ignored.
   */
  template <typename Filter>
  std::vector<Neighbour> knnSearch(double latitude,
                                   double longitude,
                                   double depth,
                                   size_t k,
                                   double maxDistance,
                                   const Filter &accept) const
  {
    Point query;
    query.latitude  = latitude;
    query.longitude = longitude;
    query.depth     = depth;

    Heap heap;
    if (k > 0)
    {
      knnSearchRecursive(query, _root, k, maxDistance, accept, heap);
    }

    std::vector<Neighbour> result;
    result.reserve(heap.size());
    while (!heap.empty())
    {
      result.push_back({&_points[heap.top().idx], heap.top().distance});
      heap.pop();
    }
    std::reverse(result.begin(), result.end());
    return result;
  }

  std::vector<Neighbour> knnSearch(double latitude,
                                   double longitude,
                                   double depth,
                                   size_t k,
                                   double maxDistance) const
  {
    return knnSearch(latitude, longitude, depth, k, maxDistance,
                     [](const Point &) { return true; });
  }

private:
  struct Node
  {
    size_t idx;    // index to the original point
    int axis;      // dimension's axis
    Node *next[2]; // child nodes
  };

  struct Candidate
  {
    size_t idx;
    double distance;
    bool operator<(const Candidate &other) const
    {
      return distance < other.distance;
    }
  };

  // max-heap: the furthest of the current k candidates is on top
  using Heap = std::priority_queue<Candidate>;

  Node *buildRecursive(size_t *indices, size_t npoints, int depth)
  {
    if (npoints == 0) return nullptr;

    const int axis   = depth % 3; // lat, lon, depth
    const size_t mid = (npoints - 1) / 2;

    std::nth_element(indices, indices + mid, indices + npoints,
                     [&](size_t lhs, size_t rhs) {
                       return axisValue(_points[lhs], axis) <
                              axisValue(_points[rhs], axis);
                     });

    const size_t idx = indices[mid];

    Node *node    = &_nodes.at(idx);
    node->idx     = idx;
    node->axis    = axis;
    node->next[0] = buildRecursive(indices, mid, depth + 1);
    node->next[1] =
        buildRecursive(indices + mid + 1, npoints - mid - 1, depth + 1);

    return node;
  }

  static double axisValue(const Point &p, int axis)
  {
    if (axis == 0) return p.latitude;
    if (axis == 1) return p.longitude;
    if (axis == 2) return p.depth;
    throw std::runtime_error("KDTree internal logic error");
  }

  /*
   * Lower bound of the distance between the query and any point on the
   * other side of the splitting plane
   */
  double axisDistance(const Point &query, const Point &curr, int axis) const
  {
    if (axis == 0)
    {
      // meridian arc, measured at the deepest point of the tree
      return computeDistance(curr.latitude, 0, query.latitude, 0,
                             std::max(_maxDepth, query.depth));
    }
    if (axis == 2)
    {
      return std::abs(curr.depth - query.depth);
    }
    // longitude: no cheap bound (poles, antimeridian), always visit
    return 0;
  }

  template <typename Filter>
  void knnSearchRecursive(const Point &query,
                          const Node *node,
                          size_t k,
                          double maxDistance,
                          const Filter &accept,
                          Heap &heap) const
  {
    if (!node)
    {
      return;
    }

    const Point &curr = _points[node->idx];

    double dist = computeDistance(curr.latitude, curr.longitude, curr.depth,
                                  query.latitude, query.longitude, query.depth);

    if (dist <= maxDistance && accept(curr))
    {
      if (heap.size() < k)
      {
        heap.push({node->idx, dist});
      }
      else if (dist < heap.top().distance)
      {
        heap.pop();
        heap.push({node->idx, dist});
      }
    }

    const int axis = node->axis;
    const int dir  = axisValue(query, axis) < axisValue(curr, axis) ? 0 : 1;

    knnSearchRecursive(query, node->next[dir], k, maxDistance, accept, heap);

    const double bound =
        heap.size() < k ? maxDistance : std::min(maxDistance, heap.top().distance);
    if (axisDistance(query, curr, axis) <= bound)
    {
      knnSearchRecursive(query, node->next[dir == 0 ? 1 : 0], k, maxDistance,
                         accept, heap);
    }
  }

private:
  Node *_root = nullptr;
  std::vector<Node> _nodes;
  std::vector<Point> _points;
  double _maxDepth = 0;
};

} // namespace MEL

#endif
