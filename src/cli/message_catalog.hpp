#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace timetrack {

// Equivalent phrasings for success and failure notices. Placeholders:
// {time} the event time, {since} the prior event time, {elapsed} the
// duration between the two, {state} the current state.
class MessageCatalog
{
public:
    MessageCatalog();
    explicit MessageCatalog(std::uint32_t seed);

    std::string successMessage(const SuccessNotice &notice);
    std::string failureMessage(const FailureNotice &notice);

    const std::vector<std::string> &successVariants(EventKind kind) const;
    const std::vector<std::string> &failureVariants(ErrorKind kind) const;

private:
    const std::string &pick(const std::vector<std::string> &variants);

    std::mt19937 m_rng;
};

std::string describeState(const std::optional<EventKind> &state);

} // namespace timetrack
