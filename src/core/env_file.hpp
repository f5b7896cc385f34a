#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QString>
#include <utility>
#include <vector>

namespace lanpeer {

using EnvEntry = std::pair<QByteArray, QByteArray>;

/**
 * Parse the contents of a dotenv-style file.
 *
 * Accepts `KEY=value`, `export KEY=value`, blank lines and `#` comments.
 * Values wrapped in matching single or double quotes are unquoted.
 * A non-comment line without '=' is an error naming its line number.
 */
[[nodiscard]] Result<std::vector<EnvEntry>> parse_env(const QByteArray& contents);

/**
 * Load an env file into the process environment. Variables that are
 * already set keep their value. A missing file is not an error.
 *
 * @return Number of variables that were set
 */
[[nodiscard]] Result<int> load_env_file(const QString& path);

} // namespace lanpeer
