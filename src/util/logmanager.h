/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The objreg project is free software: you can redistribute it
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
#include "../config.h"

#include <boost/filesystem.hpp>

namespace objreg {

    /**
     * Owns the log file the Logger writes to. Destroying the manager
     * routes output back to stderr.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logdir="", bool append=true) : _enabled(false), _append(append), _file(0) {
            string dir = logdir;
            if(dir.empty()) {
                const char* env = getenv("OBJREG_LOG_DIR");
                if(!env) {
                    throw std::runtime_error("LogManager: no log directory given and OBJREG_LOG_DIR is not set");
                }
                dir = env;
            }

            boost::filesystem::path p(dir);
            if(boost::filesystem::exists(p) && !boost::filesystem::is_directory(p)) {
                throw std::runtime_error("LogManager: logpath [" + dir + "] should be a directory not a file");
            }
            boost::system::error_code ec;
            boost::filesystem::create_directories(p, ec);
            if(ec) {
                throw std::runtime_error("LogManager: can't create [" + dir + "]: " + ec.message());
            }

            start((p / OBJREG_LOG_FILE_NAME).string());
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if(_file) {
                fclose(_file);
                _file = 0;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            if(strftime(buf, sizeof(buf), fmt, &t) == 0) {
                return "";
            }
            return buf;
        }

        void rotate() {
            if( !_enabled ) {
                cerr << "LogManager not enabled" << endl;
                return;
            }

            string rotated;
            if ( _file ) {
                // Rename the (open) existing log file to a timestamped name
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false ) << "." << ++_rotations;
                rotated = ss.str();
                boost::system::error_code ec;
                boost::filesystem::rename( _path, rotated, ec );
                if ( ec ) {
                    throw std::runtime_error("LogManager: can't rotate [" + _path + "]: " + ec.message());
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("LogManager: can't open [" + _path + "] for log file: " + errnoWithDescription());
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( _file )
                fclose( _file );
            _file = tmp;

            if ( !rotated.empty() ) {
                _rotated.push_back(rotated);
            }
        }

        const string& path() const { return _path; }
        const vector<string>& rotatedFiles() const { return _rotated; }

    private:
        void start( const string& lp ) {
            bool exists = boost::filesystem::exists(lp);

            FILE * test = fopen( lp.c_str() , _append ? "a" : "w" );
            if ( ! test ) {
                throw std::runtime_error("LogManager: can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (_append && exists){
                const string msg = "\n\n***** REGISTRY RESTARTED *****\n\n\n";
                fwrite(msg.data(), 1, msg.size(), test);
            }

            fclose( test );

            _path = lp;
            _enabled = true;
            rotate();
        }

        bool _enabled;
        bool _append;
        string _path;
        FILE *_file;
        unsigned _rotations = 0;
        vector<string> _rotated;
    };
}
