/**
 * @file quickstart.cpp
 * @brief Minimal working example of a blockio write + read
 *
 * Run:   ./examples/quickstart
 */

#include <blockio.hpp>

#include <iostream>
#include <cstring>
#include <unistd.h>

constexpr size_t BUF_SIZE = 4096;

int main() {
    const char* test_file = "/tmp/blockio_quickstart.tmp";
    const char* test_data = "Hello from blockio! This is async block I/O.\n";

    try {
        // Create engine (RAII - drained and joined on destruction)
        blockio::Engine engine;

        // Allocate aligned, pinned buffer (RAII - released automatically)
        auto out = engine.allocate_buffer(BUF_SIZE);
        std::memset(out.data(), 0, BUF_SIZE);
        std::memcpy(out.data(), test_data, strlen(test_data));

        // Fire and wait: one write, one result
        auto written = engine.wait(engine.submit_write(out, test_file, 0));
        if (!written.success) {
            std::cerr << "Write failed: " << written.error->message() << "\n";
            return 1;
        }
        std::cout << "Write completed: " << written.bytes_transferred << " bytes in "
                  << written.latency_ns / 1000 << " us\n";

        // Read it back into a second buffer
        auto in = engine.allocate_buffer(BUF_SIZE);
        (void)engine.submit_read(in, test_file, 0);
        for (const auto& r : engine.wait()) {
            if (!r.success) {
                std::cerr << "Read failed: " << r.error->message() << "\n";
                unlink(test_file);
                return 1;
            }
            std::cout << "Read completed: " << r.bytes_transferred << " bytes\n";
        }

        std::cout << "Data read: " << static_cast<const char*>(in.data());

        unlink(test_file);
        std::cout << "Success!\n";
        return 0;

    } catch (const blockio::Error& e) {
        std::cerr << "blockio error: " << e.what() << "\n";
        unlink(test_file);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        unlink(test_file);
        return 1;
    }
}
