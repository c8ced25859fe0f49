// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file fwd.hpp
 * @brief Forward declarations for rdd
 */

#ifndef RDD_FWD_HPP
#define RDD_FWD_HPP

namespace rdd {

class Error;
class Buffer;
class Endpoint;
class JobOptions;
class JobDescriptor;
class JobResult;
class Digest;
class CancelToken;
class ProgressSink;
class CopyEngine;

struct EndpointOptions;
struct ProgressSample;

} // namespace rdd

#endif // RDD_FWD_HPP
