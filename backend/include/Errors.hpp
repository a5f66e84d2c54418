#pragma once
// Errors.hpp
// Exception types for conditions that are exceptional rather than expected
// outcomes of heuristic extraction.

#include <stdexcept>
#include <string>

// PDF structural extraction exceeded its wall-clock budget
class ExtractionTimeout : public std::runtime_error {
public:
    explicit ExtractionTimeout(const std::string& what) : std::runtime_error(what) {}
};

// The PDF could not be opened or its layout dump could not be read
class UnreadablePdf : public std::runtime_error {
public:
    explicit UnreadablePdf(const std::string& what) : std::runtime_error(what) {}
};

// The vector store cannot serve requests
class StoreUnavailable : public std::runtime_error {
public:
    explicit StoreUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// A vector does not have the store's configured dimension
class DimensionMismatch : public std::invalid_argument {
public:
    explicit DimensionMismatch(const std::string& what) : std::invalid_argument(what) {}
};

// Ingestion was cancelled by its caller before the final replace
class IngestionCancelled : public std::runtime_error {
public:
    explicit IngestionCancelled(const std::string& what) : std::runtime_error(what) {}
};
