#ifndef LUSITANO_COMMON_ITER_TOOLS_HPP
#define LUSITANO_COMMON_ITER_TOOLS_HPP

#include <utility>

namespace lusitano {

/// Non-owning view over the iterator pair [begin, end). Usable in range based for loops.
template<typename Iter>
class IterRange {
public:
    IterRange(Iter b, Iter e)
        : begin_(std::move(b))
        , end_(std::move(e)) {}

    const Iter& begin() const { return begin_; }
    const Iter& end() const { return end_; }

private:
    Iter begin_;
    Iter end_;
};

} // namespace lusitano

#endif // LUSITANO_COMMON_ITER_TOOLS_HPP
