/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/scenario/ScenarioRunner.hpp"

#include "margincore/serialization/json_util.hpp"

//-------------------------------------------------------------------------

namespace margincore::scenario
{

//-------------------------------------------------------------------------

namespace
{

std::string requiredAttribute(pugi::xml_node node, const char* name)
{
    pugi::xml_attribute attr = node.attribute(name);
    if (attr.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: <{}> is missing attribute '{}'",
            std::source_location::current().function_name(), node.name(), name)};
    }
    return attr.as_string();
}

decimal_t decimalAttribute(pugi::xml_node node, const char* name)
{
    const std::string str = requiredAttribute(node, name);
    const auto parsed = util::parseDecimal(str);
    if (!parsed.has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: Attribute '{}' of <{}> is not a decimal: '{}'",
            std::source_location::current().function_name(), name, node.name(), str)};
    }
    return *parsed;
}

}  // namespace

//-------------------------------------------------------------------------

std::unique_ptr<ScenarioRunner> ScenarioRunner::fromConfig(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Unable to parse '{}': {}", ctx, path.c_str(), result.description())};
    }
    fmt::println(" - '{}' loaded successfully", path.c_str());

    return fromXml(doc.child("Scenario"));
}

//-------------------------------------------------------------------------

std::unique_ptr<ScenarioRunner> ScenarioRunner::fromXml(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!node) {
        throw std::invalid_argument{fmt::format("{}: Missing <Scenario> node", ctx)};
    }

    auto runner = std::unique_ptr<ScenarioRunner>{new ScenarioRunner};
    runner->m_doc.append_copy(node);

    runner->m_config = margin::makeMarginConfig(node.child("Margin"));

    runner->m_custody = std::make_unique<custody::TokenCustody>();
    for (pugi::xml_node wallet : node.child("Custody").children("Wallet")) {
        runner->m_custody->mint(
            requiredAttribute(wallet, "id"), decimalAttribute(wallet, "balance"));
    }

    if (pugi::xml_node oracle = node.child("Oracle"); oracle.attribute("price")) {
        runner->m_oracle.setPrice(decimalAttribute(oracle, "price"));
    }

    runner->m_engine = std::make_unique<margin::MarginEngine>(
        runner->m_config, *runner->m_custody, runner->m_oracle);

    return runner;
}

//-------------------------------------------------------------------------

void ScenarioRunner::restoreCheckpoint(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto json = json::loadJson(path);
    for (const char* member : {"engine", "custody"}) {
        if (!json.IsObject() || !json.HasMember(member)) {
            throw std::invalid_argument{fmt::format(
                "{}: Checkpoint '{}' has no '{}' section", ctx, path.c_str(), member)};
        }
    }

    auto restoredCustody = custody::TokenCustody::fromJson(json["custody"]);
    auto restoredEngine = margin::MarginEngine::fromCheckpoint(
        json["engine"], m_config, *restoredCustody, m_oracle);

    m_eventLogger.reset();
    std::swap(m_engine, restoredEngine);
    std::swap(m_custody, restoredCustody);
    restoredEngine.reset();
    if (m_eventLogPath.has_value()) {
        attachEventLog(*m_eventLogPath);
    }
    fmt::println(" - restored checkpoint '{}'", path.c_str());
}

//-------------------------------------------------------------------------

void ScenarioRunner::writeCheckpoint(const fs::path& path) const
{
    rapidjson::Document json{rapidjson::kObjectType};
    m_engine->checkpointSerialize(json, "engine");
    m_custody->checkpointSerialize(json, "custody");
    std::ofstream ofs{path};
    json::dumpJson(json, ofs);
    fmt::println(" - checkpoint written to '{}'", path.c_str());
}

//-------------------------------------------------------------------------

void ScenarioRunner::attachEventLog(const fs::path& path)
{
    m_eventLogger = std::make_unique<margin::MarginEventLogger>(path, m_engine->signals());
    m_eventLogPath = path;
}

//-------------------------------------------------------------------------

std::vector<OperationOutcome> ScenarioRunner::run()
{
    std::vector<OperationOutcome> outcomes;
    pugi::xml_node operations = m_doc.child("Scenario").child("Operations");
    for (pugi::xml_node op : operations.children()) {
        if (op.type() != pugi::node_element) continue;
        outcomes.push_back(apply(op, outcomes.size() + 1));
    }
    return outcomes;
}

//-------------------------------------------------------------------------

OperationOutcome ScenarioRunner::apply(pugi::xml_node op, size_t step)
{
    OperationOutcome outcome{.step = step, .operation = op.name()};
    try {
        dispatch(op);
    }
    catch (const accounting::LedgerException& exc) {
        outcome.error = exc.error();
        outcome.message = exc.what();
    }
    return outcome;
}

//-------------------------------------------------------------------------

void ScenarioRunner::dispatch(pugi::xml_node op)
{
    const std::string_view name = op.name();

    if (name == "Deposit") {
        const auto account = requiredAttribute(op, "account");
        m_engine->deposit(
            account,
            decimalAttribute(op, "amount"),
            op.attribute("payer").as_string(account.c_str()));
    }
    else if (name == "Withdraw") {
        const auto account = requiredAttribute(op, "account");
        m_engine->withdraw(
            account,
            decimalAttribute(op, "amount"),
            op.attribute("caller").as_string(account.c_str()));
    }
    else if (name == "SetGlobalOperator") {
        m_engine->setGlobalOperator(
            requiredAttribute(op, "identity"), op.attribute("enabled").as_bool(true));
    }
    else if (name == "SetLocalOperator") {
        m_engine->setLocalOperator(
            requiredAttribute(op, "owner"),
            requiredAttribute(op, "identity"),
            op.attribute("enabled").as_bool(true));
    }
    else if (name == "Trade") {
        m_engine->settleTrade({
            .buyer = requiredAttribute(op, "buyer"),
            .seller = requiredAttribute(op, "seller"),
            .size = decimalAttribute(op, "size"),
            .price = decimalAttribute(op, "price")
        });
    }
    else if (name == "SetPrice") {
        if (op.attribute("unavailable").as_bool()) {
            m_oracle.setUnavailable();
        } else {
            m_oracle.setPrice(decimalAttribute(op, "price"));
        }
    }
    else {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown operation <{}>",
            std::source_location::current().function_name(), name)};
    }
}

//-------------------------------------------------------------------------

}  // namespace margincore::scenario

//-------------------------------------------------------------------------
