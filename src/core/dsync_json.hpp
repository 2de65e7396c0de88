/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: dsync_json.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The single place the engine names its JSON type. Headers that take or
 * return documents include this instead of repeating the alias.
 * ============================================================================
 */

#ifndef DSYNC_JSON_HPP
#define DSYNC_JSON_HPP

#include <nlohmann/json.hpp>

using json = nlohmann::json;

#endif // DSYNC_JSON_HPP
