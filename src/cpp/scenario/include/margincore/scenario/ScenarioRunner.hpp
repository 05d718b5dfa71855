/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "margincore/accounting/LedgerError.hpp"
#include "margincore/custody/StaticPriceOracle.hpp"
#include "margincore/custody/TokenCustody.hpp"
#include "margincore/margin/MarginEngine.hpp"
#include "margincore/margin/MarginEventLogger.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace margincore::scenario
{

//-------------------------------------------------------------------------

struct OperationOutcome
{
    size_t step;
    std::string operation;
    std::optional<accounting::LedgerError> error;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

//-------------------------------------------------------------------------

/**
 * Drives a MarginEngine over TokenCustody and StaticPriceOracle from a
 * <Scenario> XML document:
 *
 *     <Scenario>
 *         <Margin marginDecimals="6" minCollateral="1"/>
 *         <Custody>
 *             <Wallet id="alice" balance="1000"/>
 *         </Custody>
 *         <Oracle price="100"/>
 *         <Operations>
 *             <Deposit account="alice" amount="150"/>
 *             <Withdraw account="alice" amount="10" caller="alice"/>
 *             ...
 *         </Operations>
 *     </Scenario>
 *
 * Ledger rejections are recorded as outcomes; malformed operations throw.
 */
class ScenarioRunner
{
public:
    [[nodiscard]] static std::unique_ptr<ScenarioRunner> fromConfig(const fs::path& path);
    [[nodiscard]] static std::unique_ptr<ScenarioRunner> fromXml(pugi::xml_node node);

    // Replaces custody and engine state; wallets from <Custody> are discarded.
    // Throws without touching the current state if the checkpoint is unusable.
    // An attached event log is reopened, which truncates it.
    void restoreCheckpoint(const fs::path& path);
    void writeCheckpoint(const fs::path& path) const;
    void attachEventLog(const fs::path& path);

    std::vector<OperationOutcome> run();
    OperationOutcome apply(pugi::xml_node op, size_t step = 0);

    [[nodiscard]] margin::MarginEngine& engine() noexcept { return *m_engine; }
    [[nodiscard]] custody::TokenCustody& custody() noexcept { return *m_custody; }
    [[nodiscard]] custody::StaticPriceOracle& oracle() noexcept { return m_oracle; }

private:
    ScenarioRunner() = default;

    void dispatch(pugi::xml_node op);

    pugi::xml_document m_doc;
    margin::MarginConfig m_config;
    std::unique_ptr<custody::TokenCustody> m_custody;
    custody::StaticPriceOracle m_oracle;
    std::unique_ptr<margin::MarginEngine> m_engine;
    std::unique_ptr<margin::MarginEventLogger> m_eventLogger;
    std::optional<fs::path> m_eventLogPath;
};

//-------------------------------------------------------------------------

}  // namespace margincore::scenario

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<margincore::scenario::OperationOutcome>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const margincore::scenario::OperationOutcome& outcome, FormatContext& ctx) const
    {
        if (outcome.ok()) {
            return fmt::format_to(ctx.out(), "#{} {}: OK", outcome.step, outcome.operation);
        }
        return fmt::format_to(
            ctx.out(),
            "#{} {}: {} ({})",
            outcome.step, outcome.operation, *outcome.error, outcome.message);
    }
};

//-------------------------------------------------------------------------
