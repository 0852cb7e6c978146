/**
 * ROM Audit - Catalog Issue
 * 
 * Problems attached to a single machine, accumulated instead of thrown.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>

namespace romaudit {

/**
 * Issue categories attached to a machine
 */
enum class IssueKind {
    CatalogIntegrity,   // Cyclic ancestry, dangling reference, duplicate logical name
    Io,                 // Supplied file could not be read
    MalformedEntry      // Catalog record degraded at import time
};

std::string issueKindName(IssueKind kind);

/**
 * Problem found while importing, resolving or verifying a machine
 * 
 * Fatal issues exclude the machine from further processing.
 */
struct CatalogIssue {
    IssueKind kind = IssueKind::CatalogIntegrity;
    bool fatal = false;
    std::string machine;
    std::string part;       // Empty if the issue concerns the machine itself
    std::string message;
};

} // namespace romaudit
