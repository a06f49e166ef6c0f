#ifndef BANDIT_HPP
#define BANDIT_HPP
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <vector>
using std::vector;
using ui = std::uint32_t;

// True mean reward of every arm, indexed by arm.
using ArmSet = vector<double>;

// Index of the first maximal element, so ties go to the lowest index.
template <typename Container>
std::size_t argmax_first(const Container &c)
{
    std::size_t max_index = 0;
    auto max_value = std::numeric_limits<typename Container::value_type>::lowest();

    for (std::size_t i = 0; i < c.size(); i += 1)
    {
        if (c[i] > max_value)
        {
            max_value = c[i];
            max_index = i;
        }
    }

    return max_index;
}

inline double best_mean(const ArmSet &arms)
{
    return *std::max_element(arms.begin(), arms.end());
}
#endif
