#include "switchyard/variants/ticket_ordering.h"
#include "switchyard/utils/logging.hpp"
#include <algorithm>
#include <cstdint>

namespace switchyard {
namespace variants {

namespace {

constexpr char kIdAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

} // namespace

std::vector<Ticket> FifoOrdering::perform(const std::vector<Ticket>& tickets) {
    return tickets;
}

std::vector<Ticket> FiloOrdering::perform(const std::vector<Ticket>& tickets) {
    return std::vector<Ticket>(tickets.rbegin(), tickets.rend());
}

RandomOrdering::RandomOrdering(const core::Options& options) {
    if (options.has("seed")) {
        const auto seed = options.require<std::int64_t>("seed");
        if (seed < 0 || seed > static_cast<std::int64_t>(UINT32_MAX)) {
            throw core::ConfigurationError("seed", "must fit in 32 unsigned bits");
        }
        seed_ = static_cast<std::uint32_t>(seed);
    }
}

std::vector<Ticket> RandomOrdering::perform(const std::vector<Ticket>& tickets) {
    std::vector<Ticket> shuffled(tickets);
    std::mt19937 engine(seed_ ? *seed_ : std::random_device{}());
    std::shuffle(shuffled.begin(), shuffled.end(), engine);
    return shuffled;
}

void registerOrderingVariants(core::Registry<OrderingCapability>& registry) {
    registry.registerType<FifoOrdering>("fifo", "Oldest ticket first");
    registry.registerType<FiloOrdering>("filo", "Newest ticket first");
    registry.registerType<RandomOrdering>("random", "Shuffled, optionally seeded");
}

SupportDesk::SupportDesk(std::uint32_t idSeed) : idGenerator_(idSeed) {}

Ticket SupportDesk::addTicket(std::string customer, std::string issue) {
    tickets_.push_back(Ticket{generateId(), std::move(customer), std::move(issue)});
    return tickets_.back();
}

std::vector<Ticket> SupportDesk::process(const OrderingContext& ordering) {
    std::vector<Ticket> ordered = ordering.execute(tickets_);
    tickets_.clear();

    if (ordered.empty()) {
        SWLOG_INFO("no tickets to process");
        return ordered;
    }

    for (const auto& ticket : ordered) {
        SWLOG_INFO("processing ticket " << ticket.id << " from " << ticket.customer
                   << ": " << ticket.issue);
    }
    return ordered;
}

std::string SupportDesk::generateId() {
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kIdAlphabet) - 2);
    std::string id;
    id.reserve(kTicketIdLength);
    for (std::size_t i = 0; i < kTicketIdLength; ++i) {
        id.push_back(kIdAlphabet[pick(idGenerator_)]);
    }
    return id;
}

} // namespace variants
} // namespace switchyard
