#pragma once

#include <numeric>
#include <vector>

namespace bodymeasure
{

/**
 * Disjoint sets over arena indices [0, n). The representative of a set is always its lowest index, so the
 * labelling is independent of the order in which unions happen.
 */
class UnionFind
{
  public:
    explicit UnionFind(size_t n) : _parent(n)
    {
        std::iota(_parent.begin(), _parent.end(), 0);
    }

    size_t find(size_t i)
    {
        while (_parent[i] != i)
        {
            _parent[i] = _parent[_parent[i]];
            i = _parent[i];
        }
        return i;
    }

    void unite(size_t a, size_t b)
    {
        a = find(a);
        b = find(b);
        if (a < b)
            _parent[b] = a;
        else if (b < a)
            _parent[a] = b;
    }

    size_t size() const
    {
        return _parent.size();
    }

  private:
    std::vector<size_t> _parent;
};

} // namespace bodymeasure
