// panic_handler.hpp - Panic Handler for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <iostream>
#include <fstream>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <ctime>
#include <string>

#include <execinfo.h>
#include <unistd.h>
#include <sys/utsname.h>
#include <sys/resource.h>

namespace EKrut::Utils {
    class PanicHandler {
    public:
        // Install handlers for fatal signals and std::terminate. dumpPath receives the panic trace.
        static void init(const std::string& dumpPath = "ekrut_panic_dump.txt") {
            dumpFile() = dumpPath;
            std::set_terminate(terminateHandler);
            std::signal(SIGSEGV, signalHandler);
            std::signal(SIGABRT, signalHandler);
            std::signal(SIGFPE,  signalHandler);
            std::signal(SIGILL,  signalHandler);
        }

    private:
        static std::string& dumpFile() {
            static std::string path = "ekrut_panic_dump.txt";
            return path;
        }

        static void signalHandler(int signal) {
            std::string reason;
            switch (signal) {
                case SIGSEGV: reason = "Segmentation Fault"; break;
                case SIGABRT: reason = "Abort (SIGABRT)"; break;
                case SIGFPE:  reason = "Floating Point Exception"; break;
                case SIGILL:  reason = "Illegal Instruction"; break;
                default: reason = "Unknown Fatal Signal"; break;
            }
            panic(reason);
            std::_Exit(EXIT_FAILURE);
        }

        static void terminateHandler() {
            if (auto eptr = std::current_exception()) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    panic(std::string("Unhandled exception: ") + e.what());
                } catch (...) {
                    panic("Unhandled non-standard exception");
                }
            } else {
                panic("Unknown termination cause");
            }
            std::_Exit(EXIT_FAILURE);
        }

        static void dumpStack(std::ostream& out) {
            void* buffer[64];
            int nptrs = backtrace(buffer, 64);
            char** strings = backtrace_symbols(buffer, nptrs);
            if (!strings) {
                out << "(no symbols)\n";
                return;
            }

            for (int i = 0; i < nptrs; ++i) {
                out << i << ": " << strings[i] << "\n";
            }
            free(strings);
        }

        static void dumpSystemInfo(std::ostream& out) {
            out << "---- System Info ----\n";
            struct utsname unameData;
            if (uname(&unameData) == 0) {
                out << "Platform: " << unameData.sysname << " " << unameData.release
                    << " (" << unameData.machine << ")\n";
            }
            out << "Process ID: " << getpid() << "\n";

            struct rusage usage;
            if (getrusage(RUSAGE_SELF, &usage) == 0)
                out << "Memory usage: " << usage.ru_maxrss << " KB\n";
            out << "----------------------\n";
        }

        // Write the panic trace. Do not use by itself, throw an error instead.
        static void panic(const std::string& reason) {
            std::cerr << "\n***\033[31m EKRUT SERVER PANIC! \033[0m***\n";
            std::cerr << "Reason: " << reason << "\n";

            std::ofstream dump(dumpFile(), std::ios::trunc);
            if (dump.is_open()) {
                dump << "==== PANIC DUMP ====\n";
                dump << "Time: " << currentTime() << "\n";
                dump << "Reason: " << reason << "\n";
                dumpSystemInfo(dump);
                dump << "---- Stack Trace ----\n";
                dumpStack(dump);
                dump << "====================\n\n";
                std::cerr << "Panic trace written to " << dumpFile() << "\n";
            }
        }

        // Gets the current time
        static std::string currentTime() {
            std::time_t t = std::time(nullptr);
            char buf[64];
            std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&t));
            return buf;
        }
    };
}
