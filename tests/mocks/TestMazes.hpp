/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TEST_MAZES_HPP
#define TEST_MAZES_HPP

#include "world/GridMaze.hpp"
#include <string>
#include <vector>

namespace TestMazes {

/**
 * Small maze with a single-cell door at column 4.
 *
 *   exit point    (36, 28)  = center of cell (4, 3)
 *   house center  (36, 52)  = center of cell (4, 6)
 *   entrance cell (4, 3)
 *
 * Cell (4, 3) is a T junction (Up, Left, Right), (4, 1) is a T junction
 * (Left, Down, Right).
 */
inline const std::vector<std::string>& junctionLayout() {
    static const std::vector<std::string> layout{
        "#########",
        "#.......#",
        "#.## ##.#",
        "#.......#",
        "####-####",
        "##     ##",
        "##     ##",
        "#########"
    };
    return layout;
}

inline PhantomMaze::GridMaze junction() {
    return PhantomMaze::GridMaze(junctionLayout());
}

} // namespace TestMazes

#endif // TEST_MAZES_HPP
