// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "applicationmatcher.h"
#include "types.h"

namespace Tessera {

std::optional<ApplicationMatcher> ApplicationMatcher::compile(const QString& applicationId,
                                                              const QString& applicationGlob,
                                                              const QString& titlePattern, QString* errorString)
{
    ApplicationMatcher matcher;
    matcher.m_applicationId = applicationId;

    if (!applicationGlob.isEmpty()) {
        matcher.m_glob = QRegularExpression(QRegularExpression::wildcardToRegularExpression(applicationGlob),
                                            QRegularExpression::CaseInsensitiveOption);
        if (!matcher.m_glob.isValid()) {
            if (errorString) {
                *errorString = matcher.m_glob.errorString();
            }
            return std::nullopt;
        }
        matcher.m_hasGlob = true;
    }

    if (!titlePattern.isEmpty()) {
        matcher.m_title = QRegularExpression(titlePattern);
        if (!matcher.m_title.isValid()) {
            if (errorString) {
                *errorString = matcher.m_title.errorString();
            }
            return std::nullopt;
        }
        matcher.m_title.optimize();
        matcher.m_hasTitle = true;
    }

    return matcher;
}

bool ApplicationMatcher::matches(const WindowSnapshot& window) const
{
    return matches(window.applicationId, window.title);
}

bool ApplicationMatcher::matches(const QString& applicationId, const QString& title) const
{
    if (isEmpty()) {
        return false;
    }
    if (!m_applicationId.isEmpty() && applicationId != m_applicationId) {
        return false;
    }
    if (m_hasGlob && !m_glob.match(applicationId).hasMatch()) {
        return false;
    }
    if (m_hasTitle && !m_title.match(title).hasMatch()) {
        return false;
    }
    return true;
}

} // namespace Tessera
