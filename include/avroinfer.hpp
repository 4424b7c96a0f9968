#pragma once

/// @file avroinfer.hpp
/// @brief Main header for avroinfer - derives Avro record schemas from sample JSON
///
/// Usage:
/// @code
/// #include <avroinfer.hpp>
///
/// int main() {
///     auto schema = avroinfer::derive_schema_from_text(R"({"A":1,"B":1.5})", "record",
///                                                       avroinfer::DeriveOptions::strict());
///     // {"type":"record","name":"record","fields":[{"name":"A","type":"int"},...]}
///
///     auto ranked = avroinfer::derive_multiple(messages, avroinfer::DeriveOptions::strict());
/// }
/// @endcode

// Core types, errors and configuration
#include "avroinfer/types.hpp"
#include "avroinfer/exceptions.hpp"
#include "avroinfer/result.hpp"
#include "avroinfer/logging.hpp"
#include "avroinfer/settings.hpp"
#include "avroinfer/version.hpp"

// Parsed input
#include "avroinfer/value.hpp"

// Type engine
#include "avroinfer/schema/type_node.hpp"
#include "avroinfer/schema/classifier.hpp"
#include "avroinfer/schema/unifier.hpp"
#include "avroinfer/schema/merger.hpp"
#include "avroinfer/schema/union_synth.hpp"
#include "avroinfer/schema/renderer.hpp"

// Entry points
#include "avroinfer/derive.hpp"
#include "avroinfer/aggregator.hpp"
