#pragma once

#include "switchyard/core/capability.h"
#include "switchyard/core/context.h"
#include "switchyard/core/options.h"
#include "switchyard/core/registry.h"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace switchyard {
namespace variants {

struct Ticket {
    std::string id;
    std::string customer;
    std::string issue;

    bool operator==(const Ticket& other) const {
        return id == other.id && customer == other.customer && issue == other.issue;
    }
    bool operator!=(const Ticket& other) const { return !(*this == other); }
};

/// Decides the order in which queued tickets are handled.
using OrderingCapability = core::Capability<std::vector<Ticket>, std::vector<Ticket>>;
using OrderingContext = core::Context<std::vector<Ticket>, std::vector<Ticket>>;

/// First in, first out.
class FifoOrdering : public OrderingCapability {
public:
    std::string name() const override { return "fifo"; }
    std::vector<Ticket> perform(const std::vector<Ticket>& tickets) override;
};

/// First in, last out.
class FiloOrdering : public OrderingCapability {
public:
    std::string name() const override { return "filo"; }
    std::vector<Ticket> perform(const std::vector<Ticket>& tickets) override;
};

/**
 * @brief Shuffled order.
 *
 * With option "seed" (unsigned int) every call produces the same permutation
 * for the same input; without it each call draws a fresh seed.
 */
class RandomOrdering : public OrderingCapability {
public:
    explicit RandomOrdering(const core::Options& options = core::Options());

    std::string name() const override { return "random"; }
    std::vector<Ticket> perform(const std::vector<Ticket>& tickets) override;

    std::optional<std::uint32_t> seed() const { return seed_; }

private:
    std::optional<std::uint32_t> seed_;
};

/// Registers "fifo", "filo" and "random".
void registerOrderingVariants(core::Registry<OrderingCapability>& registry);

/**
 * @brief Ticket queue processed in the order chosen by an ordering context.
 */
class SupportDesk {
public:
    static constexpr std::size_t kTicketIdLength = 8;

    explicit SupportDesk(std::uint32_t idSeed = std::random_device{}());

    /// Queue a ticket under a freshly generated id and return it.
    Ticket addTicket(std::string customer, std::string issue);

    std::size_t pending() const { return tickets_.size(); }
    const std::vector<Ticket>& tickets() const { return tickets_; }

    /**
     * @brief Handle every queued ticket in the order produced by ordering.
     *
     * The queue is emptied once the ordering succeeds. An empty queue yields
     * an empty result.
     *
     * @return The tickets in the order they were handled
     * @throws core::NoStrategySelectedError if ordering has no strategy
     */
    std::vector<Ticket> process(const OrderingContext& ordering);

private:
    std::string generateId();

    std::vector<Ticket> tickets_;
    std::mt19937 idGenerator_;
};

} // namespace variants
} // namespace switchyard
