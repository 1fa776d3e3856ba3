#ifndef RECOMMENDER_ERRORS_H
#define RECOMMENDER_ERRORS_H

#include <stdexcept>
#include <string>

struct RecommenderError : public std::runtime_error {
    explicit RecommenderError(const std::string& what) : std::runtime_error(what) {}
    // short machine-readable tag used by the api_cli error replies
    virtual const char* category() const noexcept { return "recommender_error"; }
};

// bad mode / metric / k / min_ratings, fatal at construction
struct InvalidConfigurationError : public RecommenderError {
    explicit InvalidConfigurationError(const std::string& what) : RecommenderError(what) {}
    const char* category() const noexcept override { return "invalid_configuration"; }
};

// malformed rating table (missing columns, rating outside [1,5])
struct InvalidInputError : public RecommenderError {
    explicit InvalidInputError(const std::string& what) : RecommenderError(what) {}
    const char* category() const noexcept override { return "invalid_input"; }
};

// fit left zero users or zero items after min_ratings filtering
struct InsufficientDataError : public RecommenderError {
    explicit InsufficientDataError(const std::string& what) : RecommenderError(what) {}
    const char* category() const noexcept override { return "insufficient_data"; }
};

struct NotFittedError : public RecommenderError {
    explicit NotFittedError(const std::string& what) : RecommenderError(what) {}
    const char* category() const noexcept override { return "not_fitted"; }
};

// similar-users on an item_based model or similar-items on a user_based one
struct ModeMismatchError : public RecommenderError {
    explicit ModeMismatchError(const std::string& what) : RecommenderError(what) {}
    const char* category() const noexcept override { return "mode_mismatch"; }
};

#endif
