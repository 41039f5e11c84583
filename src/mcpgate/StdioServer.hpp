// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gateway/Gateway.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcpgate
{

/// @brief Serves the gateway's JSON-RPC protocol over a pair of file descriptors.
///
/// Reads one JSON document per line from the input and writes one reply per
/// line to the output. tools/call requests run on their own threads so a
/// slow backend does not hold up other requests; all writes are serialized.
class StdioServer
{
  public:
    StdioServer(Gateway& gateway, int inputFd, int outputFd);
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    /// @brief Serves until end of input or until stopRequested becomes true.
    ///
    /// In-flight tool calls are allowed to finish before this returns.
    /// @return 0 on a clean end of input or stop, 1 on a read error.
    [[nodiscard]] auto run(const std::atomic<bool>& stopRequested) -> int;

  private:
    void dispatch(std::string line);
    void writeMessage(const nlohmann::json& message);
    void joinCalls();

    Gateway& _gateway;
    int _inputFd;
    int _outputFd;

    std::mutex _writeMutex;
    std::mutex _callsMutex;
    struct Call
    {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::vector<Call> _calls;
};

} // namespace mcpgate
