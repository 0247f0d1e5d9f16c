/* JSON representation of sqlgate values, for use with nlohmann::json.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include sqlgate/json instead.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
#ifndef SQLGATE_H_JSON
#define SQLGATE_H_JSON

#if !defined(SQLGATE_HEADER_PRE)
#  error "Include sqlgate headers as <sqlgate/header>, not <sqlgate/header.hxx>."
#endif

#include <string>

#include <nlohmann/json.hpp>

#include "sqlgate/query_string.hxx"
#include "sqlgate/types.hxx"


namespace sqlgate
{
/// A storage mode becomes its name, e.g. `"shared"`.
inline void to_json(nlohmann::json &out, storage mode)
{
  out = std::string{name_of(mode)};
}


/// A query string becomes an object with its text and its storage mode.
/** For example, `{"query": "SELECT 1", "storage": "static"}`.  That's meant
 * for structured logs.
 *
 * There is no `from_json()`.  Text that comes out of a JSON document is
 * run-time input like any other; to make a query string out of it, wrap it in
 * @ref assert_query_safe.
 *
 * @warning `nlohmann::json::dump()` throws if the query text is not valid
 * UTF-8.
 */
inline void to_json(nlohmann::json &out, query_string const &query)
{
  out = nlohmann::json{
    {"query", std::string{query.view()}}, {"storage", query.mode()}};
}
} // namespace sqlgate
#endif
