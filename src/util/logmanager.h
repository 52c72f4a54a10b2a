/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "log.h"
#include <boost/filesystem.hpp>

namespace chunklog {

    /**
     * Routes all log output to <logdir>/chunklog.log for its lifetime.
     * An empty logdir falls back to CHUNKLOG_LOG_DIR.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logdir = "", bool append = true) : _append(append), _file(0) {
            string dir = logdir;
            if (dir.empty()) {
                const char* env = std::getenv("CHUNKLOG_LOG_DIR");
                if (!env || !*env) {
                    throw std::runtime_error("LogManager: no log directory given and CHUNKLOG_LOG_DIR is not set");
                }
                dir = env;
            }

            boost::filesystem::path p(dir);
            boost::system::error_code ec;
            boost::filesystem::create_directories(p, ec);
            if (ec) {
                throw std::runtime_error("LogManager: can't create log directory [" + dir + "]: " + ec.message());
            }
            _path = (p / "chunklog.log").string();
            start();
        }

        ~LogManager() {
            if ( _file ) {
                if ( Logger::getLogFile() == _file )
                    Logger::setLogFile(nullptr);
                fclose( _file );
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

    private:
        void start() {
            bool exists = boost::filesystem::exists(_path);

            FILE* f = fopen( _path.c_str(), _append ? "a" : "w" );
            if ( ! f ) {
                if (boost::filesystem::is_directory(_path)) {
                    throw std::runtime_error("logpath [" + _path + "] should be a file name not a directory");
                }
                throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());
            }

            if (_append && exists) {
                // two blank lines before and after
                const string msg = "\n\n***** LOG REOPENED *****\n\n\n";
                fwrite(msg.data(), 1, msg.size(), f);
                fflush(f);
            }

            _file = f;
            Logger::setLogFile(_file);
        }

        bool _append;
        string _path;
        FILE *_file;
    };
}
