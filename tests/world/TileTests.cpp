/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE TileTests
#include <boost/test/unit_test.hpp>

#include "world/CellIndex.hpp"
#include "world/Directions.hpp"
#include "world/Tile.hpp"

using namespace PhantomMaze;

BOOST_AUTO_TEST_SUITE(CellIndexTests)

BOOST_AUTO_TEST_CASE(CellIsFloorOfPositionOverCellSize) {
    BOOST_CHECK_EQUAL(CellIndex::fromPosition(Vector2D(0.0f, 0.0f)), CellIndex(0, 0));
    BOOST_CHECK_EQUAL(CellIndex::fromPosition(Vector2D(7.99f, 8.0f)), CellIndex(0, 1));
    BOOST_CHECK_EQUAL(CellIndex::fromPosition(Vector2D(108.0f, 92.0f)), CellIndex(13, 11));
    BOOST_CHECK_EQUAL(CellIndex::fromPosition(Vector2D(-0.5f, 4.0f)), CellIndex(-1, 0));
}

BOOST_AUTO_TEST_CASE(CellArithmetic) {
    const CellIndex a(3, 4);
    const CellIndex b(1, -2);
    BOOST_CHECK_EQUAL(a + b, CellIndex(4, 2));
    BOOST_CHECK_EQUAL(a - b, CellIndex(2, 6));
    BOOST_CHECK_EQUAL(a * 2, CellIndex(6, 8));
    BOOST_CHECK_EQUAL(CellIndex::distanceSquared(a, b), 4 + 36);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(DirectionTests)

BOOST_AUTO_TEST_CASE(ReverseSwapsOpposites) {
    BOOST_CHECK_EQUAL(reverseDirection(Direction::Up), Direction::Down);
    BOOST_CHECK_EQUAL(reverseDirection(Direction::Down), Direction::Up);
    BOOST_CHECK_EQUAL(reverseDirection(Direction::Left), Direction::Right);
    BOOST_CHECK_EQUAL(reverseDirection(Direction::Right), Direction::Left);
    BOOST_CHECK_EQUAL(reverseDirection(Direction::None), Direction::None);
}

BOOST_AUTO_TEST_CASE(OffsetsAreUnitSteps) {
    BOOST_CHECK_EQUAL(directionToCellOffset(Direction::Up), CellIndex(0, -1));
    BOOST_CHECK_EQUAL(directionToCellOffset(Direction::Down), CellIndex(0, 1));
    BOOST_CHECK_EQUAL(directionToCellOffset(Direction::Left), CellIndex(-1, 0));
    BOOST_CHECK_EQUAL(directionToCellOffset(Direction::Right), CellIndex(1, 0));
    BOOST_CHECK_EQUAL(directionToCellOffset(Direction::None), CellIndex(0, 0));
}

BOOST_AUTO_TEST_CASE(DirectionInfoUpdateSetsBoth) {
    DirectionInfo info;
    info.update(Direction::Left);
    BOOST_CHECK_EQUAL(info.current, Direction::Left);
    BOOST_CHECK_EQUAL(info.next, Direction::Left);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TilePositionTests)

BOOST_AUTO_TEST_CASE(DerivedValuesFollowPosition) {
    Tile tile;
    tile.updateWithPosition(Vector2D(110.0f, 93.5f));

    BOOST_CHECK_EQUAL(tile.getIndex(), CellIndex(13, 11));
    BOOST_CHECK_EQUAL(tile.getTopLeft(), Vector2D(104.0f, 88.0f));
    BOOST_CHECK_EQUAL(tile.getCenter(), Vector2D(108.0f, 92.0f));
    BOOST_CHECK_EQUAL(tile.getPosition(), Vector2D(110.0f, 93.5f));

    tile.updateWithPosition(Vector2D(4.0f, 4.0f));
    BOOST_CHECK_EQUAL(tile.getIndex(), CellIndex(0, 0));
    BOOST_CHECK_EQUAL(tile.getCenter(), Vector2D(4.0f, 4.0f));
}

BOOST_AUTO_TEST_CASE(CenterCanvasAcceptsHalfCells) {
    BOOST_CHECK_EQUAL(Tile::toCenterCanvas(Vector2D(13.5f, 11.0f)), Vector2D(112.0f, 92.0f));
    BOOST_CHECK_EQUAL(Tile::toCenterCanvas(Vector2D(0.0f, 0.0f)), Vector2D(4.0f, 4.0f));
    BOOST_CHECK_EQUAL(Tile::positionOf(CellIndex(2, 3)), Vector2D(16.0f, 24.0f));
}

BOOST_AUTO_TEST_CASE(FromIndexStartsAtTopLeft) {
    const Tile tile = Tile::fromIndex(CellIndex(5, 7));
    BOOST_CHECK_EQUAL(tile.getPosition(), Vector2D(40.0f, 56.0f));
    BOOST_CHECK_EQUAL(tile.getIndex(), CellIndex(5, 7));
    BOOST_CHECK(!tile.isInCenter());
}

BOOST_AUTO_TEST_CASE(CenteringToleranceIsInclusive) {
    Tile tile;
    tile.updateWithPosition(Vector2D(108.0f, 92.0f));
    BOOST_CHECK(tile.isInCenter());

    tile.updateWithPosition(Vector2D(108.75f, 92.0f));
    BOOST_CHECK(tile.isInCenter());

    tile.updateWithPosition(Vector2D(108.0f, 91.25f));
    BOOST_CHECK(tile.isInCenter());

    tile.updateWithPosition(Vector2D(108.8f, 92.0f));
    BOOST_CHECK(!tile.isInCenter());
    BOOST_CHECK(tile.isNearCenter(1.0f));

    tile.updateWithPosition(Vector2D(108.0f, 93.0f));
    BOOST_CHECK(!tile.isInCenter());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TileWrapTests)

BOOST_AUTO_TEST_CASE(LeftEdgeWrapsToRight) {
    Tile tile;
    tile.updateWithPosition(Vector2D(-2.0f, 116.0f));

    BOOST_CHECK_EQUAL(tile.getIndex(), CellIndex(27, 14));
    BOOST_CHECK_EQUAL(tile.getPosition(), Vector2D(222.0f, 116.0f));
}

BOOST_AUTO_TEST_CASE(RightEdgeWrapsToLeft) {
    Tile tile;
    tile.updateWithPosition(Vector2D(225.0f, 116.0f));

    BOOST_CHECK_EQUAL(tile.getIndex(), CellIndex(0, 14));
    BOOST_CHECK_EQUAL(tile.getPosition(), Vector2D(1.0f, 116.0f));
}

BOOST_AUTO_TEST_CASE(WrapUsesGivenMazeWidth) {
    Tile tile(9);
    tile.updateWithPosition(Vector2D(72.0f, 4.0f));
    BOOST_CHECK_EQUAL(tile.getIndex(), CellIndex(0, 0));
    BOOST_CHECK_EQUAL(tile.getMazeWidthInCells(), 9);
}

BOOST_AUTO_TEST_CASE(NeighbourAcrossTunnelWraps) {
    Tile tile;
    tile.updateWithPosition(Tile::toCenterCanvas(Vector2D(0.0f, 14.0f)));

    BOOST_CHECK_EQUAL(tile.nextTileWrapped(Direction::Left).getIndex(), CellIndex(27, 14));
    BOOST_CHECK_EQUAL(tile.nextTileWrapped(Direction::Right).getIndex(), CellIndex(1, 14));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TileAdjacencyTests)

BOOST_AUTO_TEST_CASE(NextTileIsOneCellAway) {
    Tile tile;
    tile.updateWithPosition(Vector2D(106.0f, 92.0f));

    BOOST_CHECK_EQUAL(tile.nextTile(Direction::Up).getIndex(), CellIndex(13, 10));
    BOOST_CHECK_EQUAL(tile.nextTile(Direction::Down).getIndex(), CellIndex(13, 12));
    BOOST_CHECK_EQUAL(tile.nextTile(Direction::Left).getIndex(), CellIndex(12, 11));
    BOOST_CHECK_EQUAL(tile.nextTile(Direction::Right).getIndex(), CellIndex(14, 11));
    BOOST_CHECK_EQUAL(tile.nextTile(Direction::None).getIndex(), CellIndex(13, 11));
}

BOOST_AUTO_TEST_CASE(NextTileIsIdempotent) {
    Tile tile;
    tile.updateWithPosition(Vector2D(108.0f, 92.0f));

    const Tile& first = tile.nextTile(Direction::Left);
    const CellIndex firstIndex = first.getIndex();
    const Tile& second = tile.nextTile(Direction::Left);

    BOOST_CHECK_EQUAL(&first, &second);
    BOOST_CHECK_EQUAL(second.getIndex(), firstIndex);
    BOOST_CHECK_EQUAL(tile.getIndex(), CellIndex(13, 11));
}

BOOST_AUTO_TEST_CASE(NextTileFollowsMovedTile) {
    Tile tile;
    tile.updateWithPosition(Vector2D(108.0f, 92.0f));
    BOOST_CHECK_EQUAL(tile.nextTile(Direction::Right).getIndex(), CellIndex(14, 11));

    tile.updateWithPosition(Vector2D(36.0f, 28.0f));
    BOOST_CHECK_EQUAL(tile.nextTile(Direction::Right).getIndex(), CellIndex(5, 3));
}

BOOST_AUTO_TEST_SUITE_END()
