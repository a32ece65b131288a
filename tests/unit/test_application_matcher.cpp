// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>

#include "core/applicationmatcher.h"
#include "core/types.h"

using namespace Tessera;

/**
 * @brief Unit tests for ApplicationMatcher
 *
 * Tests cover:
 * - Exact application ids, globs and title patterns, alone and combined
 * - Rejection of invalid title patterns
 * - Empty matchers
 */
class TestApplicationMatcher : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testMatch_data()
    {
        QTest::addColumn<QString>("applicationId");
        QTest::addColumn<QString>("glob");
        QTest::addColumn<QString>("title");
        QTest::addColumn<QString>("windowApp");
        QTest::addColumn<QString>("windowTitle");
        QTest::addColumn<bool>("expected");

        QTest::newRow("exact id") << QStringLiteral("org.kde.kate") << QString() << QString()
                                  << QStringLiteral("org.kde.kate") << QStringLiteral("notes.txt") << true;
        QTest::newRow("exact id, other app") << QStringLiteral("org.kde.kate") << QString() << QString()
                                             << QStringLiteral("org.kde.kwrite") << QString() << false;
        QTest::newRow("exact id is case sensitive") << QStringLiteral("org.kde.kate") << QString() << QString()
                                                    << QStringLiteral("ORG.KDE.KATE") << QString() << false;
        QTest::newRow("glob") << QString() << QStringLiteral("org.kde.*") << QString()
                              << QStringLiteral("org.kde.dolphin") << QString() << true;
        QTest::newRow("glob ignores case") << QString() << QStringLiteral("*Firefox*") << QString()
                                           << QStringLiteral("org.mozilla.firefox") << QString() << true;
        QTest::newRow("glob anchored") << QString() << QStringLiteral("kde.*") << QString()
                                       << QStringLiteral("org.kde.dolphin") << QString() << false;
        QTest::newRow("title") << QString() << QString() << QStringLiteral("^Picture-in-Picture$")
                               << QStringLiteral("firefox") << QStringLiteral("Picture-in-Picture") << true;
        QTest::newRow("title unanchored") << QString() << QString() << QStringLiteral("Settings")
                                          << QStringLiteral("any") << QStringLiteral("System Settings") << true;
        QTest::newRow("all must hold") << QStringLiteral("org.gimp") << QString() << QStringLiteral("^GNU")
                                       << QStringLiteral("org.gimp") << QStringLiteral("Layers") << false;
        QTest::newRow("all hold") << QStringLiteral("org.gimp") << QStringLiteral("org.*")
                                  << QStringLiteral("^GNU") << QStringLiteral("org.gimp")
                                  << QStringLiteral("GNU Image Manipulation Program") << true;
    }

    void testMatch()
    {
        QFETCH(QString, applicationId);
        QFETCH(QString, glob);
        QFETCH(QString, title);
        QFETCH(QString, windowApp);
        QFETCH(QString, windowTitle);
        QFETCH(bool, expected);

        const auto matcher = ApplicationMatcher::compile(applicationId, glob, title);
        QVERIFY(matcher.has_value());
        QCOMPARE(matcher->matches(windowApp, windowTitle), expected);
    }

    void testMatch_windowSnapshot()
    {
        const auto matcher = ApplicationMatcher::compile(QStringLiteral("mpv"), QString(), QStringLiteral("\\.mkv$"));
        QVERIFY(matcher.has_value());

        WindowSnapshot window;
        window.applicationId = QStringLiteral("mpv");
        window.title = QStringLiteral("holiday.mkv");
        QVERIFY(matcher->matches(window));

        window.title = QStringLiteral("holiday.mp4");
        QVERIFY(!matcher->matches(window));
    }

    void testCompile_invalidTitlePattern()
    {
        QString error;
        const auto matcher = ApplicationMatcher::compile(QString(), QString(), QStringLiteral("(unclosed"), &error);

        QVERIFY(!matcher.has_value());
        QVERIFY(!error.isEmpty());
    }

    void testEmptyMatcher_matchesNothing()
    {
        const auto matcher = ApplicationMatcher::compile(QString(), QString(), QString());
        QVERIFY(matcher.has_value());
        QVERIFY(matcher->isEmpty());
        QVERIFY(!matcher->matches(QStringLiteral("org.kde.kate"), QStringLiteral("notes.txt")));
    }
};

QTEST_MAIN(TestApplicationMatcher)
#include "test_application_matcher.moc"
