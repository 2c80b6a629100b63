#pragma once

#include "conduit/environment.hpp"
#include "conduit/utility.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace conduit {

// https://docs.github.com/en/actions/using-workflows/events-that-trigger-workflows#pull_request
enum class PullRequestAction : uint8_t {
    assigned,
    unassigned,
    labeled,
    unlabeled,
    opened,
    edited,
    closed,
    reopened,
    synchronize,
    converted_to_draft,
    ready_for_review,
    locked,
    unlocked,
    review_requested,
    review_request_removed,
    auto_merge_enabled,
    auto_merge_disabled,
};

std::optional<PullRequestAction> parse_pull_request_action(std::string_view action);

struct GitRef {
    std::string ref;
    std::string sha;
};

struct PullRequest {
    int64_t id = 0;
    int64_t number = 0;
    std::string title;
    std::optional<std::string> body;
    bool is_draft = false;
    bool is_merged = false;
    GitRef base;
    GitRef head;
};

struct PullRequestEvent {
    PullRequestAction action;
    PullRequest pull_request;
};

/// Any event this library does not decode; `contents` is the raw payload.
struct OtherEvent {
    std::string name;
    std::string contents;
};

using GitHubEvent = std::variant<PullRequestEvent, OtherEvent>;

/**
 * @brief Decodes an event payload by event name.
 * @return The decoded event, or an `ErrorKind::decoding` error for a
 *         malformed pull_request payload.
 */
Result<GitHubEvent> decode_github_event(std::string_view name, std::string_view contents);

/**
 * @brief Reads the event that triggered the current run.
 *
 * In CI the payload is read from GITHUB_EVENT_PATH; locally it is taken from
 * GITHUB_EVENT_CONTENTS so events can be simulated.
 */
Result<GitHubEvent> github_event(const Environment &env);

} // namespace conduit
