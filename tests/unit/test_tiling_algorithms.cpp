// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QRect>
#include <QVector>

#include "autotile/TilingAlgorithm.h"
#include "autotile/algorithms/ColumnsAlgorithm.h"
#include "autotile/algorithms/GridAlgorithm.h"
#include "autotile/algorithms/MasterStackAlgorithm.h"
#include "core/constants.h"

using namespace Tessera;

/**
 * @brief Unit tests for tiling algorithms
 *
 * Tests cover:
 * - Primary + stack split with and without gaps, both orientations
 * - Grid shape (columns/rows) and row-major filling
 * - Columns of equal width
 * - Edge cases (0 windows, 1 window, area smaller than the margin)
 * - Pixel-perfect geometry (no overlaps, slots inside the area)
 * - Gaps too wide for the area shrinking instead of pushing slots out
 */
class TestTilingAlgorithms : public QObject
{
    Q_OBJECT

private:
    QRect m_area{0, 0, 1200, 800};

    TilingParams params(int windowCount, int gap = 0, int margin = 0, qreal ratio = 0.6) const
    {
        TilingParams p;
        p.windowCount = windowCount;
        p.area = m_area;
        p.gap = gap;
        p.margin = margin;
        p.mainAreaRatio = ratio;
        return p;
    }

    bool noOverlaps(const QVector<QRect> &slots) const
    {
        for (int i = 0; i < slots.size(); ++i) {
            for (int j = i + 1; j < slots.size(); ++j) {
                if (slots[i].intersects(slots[j])) {
                    return false;
                }
            }
        }
        return true;
    }

    bool allWithinBounds(const QVector<QRect> &slots, const QRect &bounds) const
    {
        for (const QRect &slot : slots) {
            if (!bounds.contains(slot)) {
                return false;
            }
        }
        return true;
    }

    int totalArea(const QVector<QRect> &slots) const
    {
        int area = 0;
        for (const QRect &slot : slots) {
            area += slot.width() * slot.height();
        }
        return area;
    }

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // Primary + stack
    // ═══════════════════════════════════════════════════════════════════════════

    void testPrimaryStack_threeWindowsNoGaps()
    {
        MasterStackAlgorithm algo;
        const auto slots = algo.calculateSlots(params(3));

        QCOMPARE(slots.size(), 3);
        QCOMPARE(slots[0], QRect(0, 0, 720, 800));
        QCOMPARE(slots[1], QRect(720, 0, 480, 400));
        QCOMPARE(slots[2], QRect(720, 400, 480, 400));
        QCOMPARE(totalArea(slots), m_area.width() * m_area.height());
    }

    void testPrimaryStack_singleWindowFillsArea()
    {
        MasterStackAlgorithm algo;
        const auto slots = algo.calculateSlots(params(1, 8, 8));

        QCOMPARE(slots.size(), 1);
        QCOMPARE(slots[0], QRect(8, 8, 1184, 784));
    }

    void testPrimaryStack_gapsAndMargins()
    {
        MasterStackAlgorithm algo;
        const auto slots = algo.calculateSlots(params(4, 10, 20));
        const QRect inner = m_area.adjusted(20, 20, -20, -20);

        QCOMPARE(slots.size(), 4);
        QVERIFY(noOverlaps(slots));
        QVERIFY(allWithinBounds(slots, inner));

        // Gap between primary and stack
        QCOMPARE(slots[1].left() - slots[0].right() - 1, 10);
        // Gap between stacked windows
        QCOMPARE(slots[2].top() - slots[1].bottom() - 1, 10);
    }

    void testPrimaryStack_ratioIsClamped()
    {
        MasterStackAlgorithm algo;
        const auto slots = algo.calculateSlots(params(2, 0, 0, 0.99));

        QCOMPARE(slots.size(), 2);
        QCOMPARE(slots[0].width(), static_cast<int>(1200 * Defaults::MaxMainAreaRatio));
    }

    void testPrimaryStack_verticalPutsPrimaryOnTop()
    {
        MasterStackAlgorithm algo;
        TilingParams p = params(3);
        p.area = QRect(0, 0, 800, 1200);
        p.orientation = Qt::Vertical;
        const auto slots = algo.calculateSlots(p);

        QCOMPARE(slots.size(), 3);
        QCOMPARE(slots[0], QRect(0, 0, 800, 720));
        QCOMPARE(slots[1], QRect(0, 720, 400, 480));
        QCOMPARE(slots[2], QRect(400, 720, 400, 480));
    }

    void testPrimaryStack_zeroWindows()
    {
        MasterStackAlgorithm algo;
        QVERIFY(algo.calculateSlots(params(0)).isEmpty());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Grid
    // ═══════════════════════════════════════════════════════════════════════════

    void testGrid_shape_data()
    {
        QTest::addColumn<int>("windows");
        QTest::addColumn<int>("columns");
        QTest::addColumn<int>("rows");

        QTest::newRow("1") << 1 << 1 << 1;
        QTest::newRow("2") << 2 << 2 << 1;
        QTest::newRow("4") << 4 << 2 << 2;
        QTest::newRow("5") << 5 << 3 << 2;
        QTest::newRow("9") << 9 << 3 << 3;
        QTest::newRow("10") << 10 << 4 << 3;
    }

    void testGrid_shape()
    {
        QFETCH(int, windows);
        QFETCH(int, columns);
        QFETCH(int, rows);

        QCOMPARE(GridAlgorithm::columnsFor(windows), columns);
        QCOMPARE(GridAlgorithm::rowsFor(windows), rows);
    }

    void testGrid_fiveWindowsRowMajor()
    {
        GridAlgorithm algo;
        const auto slots = algo.calculateSlots(params(5));

        QCOMPARE(slots.size(), 5);
        QCOMPARE(slots[0], QRect(0, 0, 400, 400));
        QCOMPARE(slots[1], QRect(400, 0, 400, 400));
        QCOMPARE(slots[2], QRect(800, 0, 400, 400));
        QCOMPARE(slots[3], QRect(0, 400, 400, 400));
        QCOMPARE(slots[4], QRect(400, 400, 400, 400));
        QVERIFY(noOverlaps(slots));
    }

    void testGrid_withGapsStaysInBounds()
    {
        GridAlgorithm algo;
        const auto slots = algo.calculateSlots(params(7, 12, 6));

        QCOMPARE(slots.size(), 7);
        QVERIFY(noOverlaps(slots));
        QVERIFY(allWithinBounds(slots, m_area.adjusted(6, 6, -6, -6)));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Columns
    // ═══════════════════════════════════════════════════════════════════════════

    void testColumns_equalWidths()
    {
        ColumnsAlgorithm algo;
        const auto slots = algo.calculateSlots(params(3));

        QCOMPARE(slots.size(), 3);
        for (const QRect &slot : slots) {
            QCOMPARE(slot.width(), 400);
            QCOMPARE(slot.height(), 800);
        }
        QCOMPARE(totalArea(slots), m_area.width() * m_area.height());
    }

    void testColumns_remainderGoesToFirstColumns()
    {
        ColumnsAlgorithm algo;
        TilingParams p = params(7);
        const auto slots = algo.calculateSlots(p);

        // 1200 / 7 = 171 remainder 3
        QCOMPARE(slots.size(), 7);
        QCOMPARE(slots[0].width(), 172);
        QCOMPARE(slots[2].width(), 172);
        QCOMPARE(slots[3].width(), 171);
        QCOMPARE(slots.last().right(), m_area.right());
        QVERIFY(noOverlaps(slots));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Shared behavior
    // ═══════════════════════════════════════════════════════════════════════════

    void testInnerRect_marginTooLarge()
    {
        QVERIFY(TilingAlgorithm::innerRect(QRect(0, 0, 100, 100), 50).isNull());
        QCOMPARE(TilingAlgorithm::innerRect(QRect(10, 10, 100, 100), 5), QRect(15, 15, 90, 90));
    }

    void testAllAlgorithms_emptyAreaGivesNoSlots()
    {
        MasterStackAlgorithm primary;
        GridAlgorithm grid;
        ColumnsAlgorithm columns;

        TilingParams p = params(3, 0, 600);
        QVERIFY(primary.calculateSlots(p).isEmpty());
        QVERIFY(grid.calculateSlots(p).isEmpty());
        QVERIFY(columns.calculateSlots(p).isEmpty());
    }

    void testAllAlgorithms_manyWindowsNoOverlap()
    {
        MasterStackAlgorithm primary;
        GridAlgorithm grid;
        ColumnsAlgorithm columns;
        const TilingParams p = params(12, 4, 8);
        const QRect inner = m_area.adjusted(8, 8, -8, -8);

        for (const TilingAlgorithm *algo : {static_cast<const TilingAlgorithm *>(&primary),
                                            static_cast<const TilingAlgorithm *>(&grid),
                                            static_cast<const TilingAlgorithm *>(&columns)}) {
            const auto slots = algo->calculateSlots(p);
            QCOMPARE(slots.size(), 12);
            QVERIFY2(noOverlaps(slots), qPrintable(algo->name()));
            QVERIFY2(allWithinBounds(slots, inner), qPrintable(algo->name()));
        }
    }

    void testAllAlgorithms_oversizedGapShrinks_data()
    {
        QTest::addColumn<int>("windowCount");
        QTest::addColumn<int>("gap");

        QTest::newRow("many windows") << 60 << 40;
        QTest::newRow("gap wider than the area") << 5 << 5000;
    }

    void testAllAlgorithms_oversizedGapShrinks()
    {
        QFETCH(int, windowCount);
        QFETCH(int, gap);

        MasterStackAlgorithm primary;
        GridAlgorithm grid;
        ColumnsAlgorithm columns;
        const TilingParams p = params(windowCount, gap);

        for (const TilingAlgorithm *algo : {static_cast<const TilingAlgorithm *>(&primary),
                                            static_cast<const TilingAlgorithm *>(&grid),
                                            static_cast<const TilingAlgorithm *>(&columns)}) {
            const auto slots = algo->calculateSlots(p);
            QCOMPARE(slots.size(), windowCount);
            QVERIFY2(noOverlaps(slots), qPrintable(algo->name()));
            QVERIFY2(allWithinBounds(slots, m_area), qPrintable(algo->name()));
        }
    }
};

QTEST_MAIN(TestTilingAlgorithms)
#include "test_tiling_algorithms.moc"
