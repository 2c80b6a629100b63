#include "conduit/github_event.hpp"

#include <array>
#include <format>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <utility>

namespace conduit {

namespace {

using json = nlohmann::json;

constexpr std::array<std::pair<std::string_view, PullRequestAction>, 17> action_names{{
    {"assigned", PullRequestAction::assigned},
    {"unassigned", PullRequestAction::unassigned},
    {"labeled", PullRequestAction::labeled},
    {"unlabeled", PullRequestAction::unlabeled},
    {"opened", PullRequestAction::opened},
    {"edited", PullRequestAction::edited},
    {"closed", PullRequestAction::closed},
    {"reopened", PullRequestAction::reopened},
    {"synchronize", PullRequestAction::synchronize},
    {"converted_to_draft", PullRequestAction::converted_to_draft},
    {"ready_for_review", PullRequestAction::ready_for_review},
    {"locked", PullRequestAction::locked},
    {"unlocked", PullRequestAction::unlocked},
    {"review_requested", PullRequestAction::review_requested},
    {"review_request_removed", PullRequestAction::review_request_removed},
    {"auto_merge_enabled", PullRequestAction::auto_merge_enabled},
    {"auto_merge_disabled", PullRequestAction::auto_merge_disabled},
}};

GitRef decode_ref(const json &j) {
    return {.ref = j.at("ref").get<std::string>(), .sha = j.at("sha").get<std::string>()};
}

Result<PullRequestEvent> decode_pull_request(std::string_view contents) {
    try {
        json payload = json::parse(contents);

        auto action_name = payload.at("action").get<std::string>();
        auto action = parse_pull_request_action(action_name);
        if (!action) {
            return std::unexpected(
                Error::of(ErrorKind::decoding, std::format("Unknown pull_request action: {}", action_name)));
        }

        const json &pr = payload.at("pull_request");
        PullRequest pull_request{
            .id = pr.at("id").get<int64_t>(),
            .number = pr.at("number").get<int64_t>(),
            .title = pr.at("title").get<std::string>(),
            .body = std::nullopt,
            .is_draft = pr.at("draft").get<bool>(),
            .is_merged = pr.at("merged").get<bool>(),
            .base = decode_ref(pr.at("base")),
            .head = decode_ref(pr.at("head")),
        };
        if (auto body = pr.find("body"); body != pr.end() && !body->is_null()) {
            pull_request.body = body->get<std::string>();
        }

        return PullRequestEvent{.action = *action, .pull_request = std::move(pull_request)};
    } catch (const json::exception &err) {
        return std::unexpected(Error::of(ErrorKind::decoding, "Failed to decode GitHub pull_request event", err.what()));
    }
}

} // namespace

std::optional<PullRequestAction> parse_pull_request_action(std::string_view action) {
    for (const auto &[name, value] : action_names) {
        if (name == action) {
            return value;
        }
    }
    return std::nullopt;
}

Result<GitHubEvent> decode_github_event(std::string_view name, std::string_view contents) {
    if (name == "pull_request") {
        auto event = decode_pull_request(contents);
        if (!event) {
            return std::unexpected(event.error());
        }
        return GitHubEvent{std::move(*event)};
    }
    return GitHubEvent{OtherEvent{.name = std::string(name), .contents = std::string(contents)}};
}

Result<GitHubEvent> github_event(const Environment &env) {
    auto name = env.require("GITHUB_EVENT_NAME");
    if (!name) {
        return std::unexpected(name.error());
    }

    std::string contents;
    if (env.is_true("CI")) {
        auto path = env.require("GITHUB_EVENT_PATH");
        if (!path) {
            return std::unexpected(path.error());
        }
        std::ifstream file(*path);
        if (!file.is_open()) {
            return std::unexpected(Error::of(ErrorKind::environment, std::format("Could not open event file: {}", *path)));
        }
        contents.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    } else {
        auto simulated = env.require("GITHUB_EVENT_CONTENTS");
        if (!simulated) {
            return std::unexpected(simulated.error());
        }
        contents = std::move(*simulated);
    }

    return decode_github_event(*name, contents);
}

} // namespace conduit
