/**
 * @file fwd.hpp
 * @brief Forward declarations for blockio
 */

#ifndef BLOCKIO_FWD_HPP
#define BLOCKIO_FWD_HPP

namespace blockio {

class Engine;
class Buffer;
class BufferHandle;
class OperationHandle;
class Options;
class Stats;
class Error;
struct IoError;
struct OperationResult;

namespace detail {
class BufferRegistry;
class EngineCore;
} // namespace detail

} // namespace blockio

#endif // BLOCKIO_FWD_HPP
