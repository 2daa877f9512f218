#include "field_catalog.hpp"
#include "config_parser.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace fairvalue {

// ============================================================================
// FieldSpec
// ============================================================================

FieldSpec::FieldSpec()
    : metric(), statement(StatementKind::IncomeStatement), kind(MetricKind::Flow),
      candidates(), percent_scaled(false) {}

FieldSpec::FieldSpec(std::string metric_name, StatementKind source, MetricKind metric_kind,
                     FieldCandidateList labels, bool percent)
    : metric(std::move(metric_name)), statement(source), kind(metric_kind),
      candidates(std::move(labels)), percent_scaled(percent) {}

std::string metric_kind_to_string(MetricKind kind) {
    return kind == MetricKind::Flow ? "flow" : "stock";
}

MetricKind metric_kind_from_string(const std::string& text) {
    if (text == "flow") return MetricKind::Flow;
    if (text == "stock") return MetricKind::Stock;
    throw std::invalid_argument("Unknown metric kind: " + text + " (expected flow or stock)");
}

// ============================================================================
// Built-in catalog
// ============================================================================

FieldCatalog FieldCatalog::default_catalog() {
    using namespace metric;
    constexpr StatementKind IS = StatementKind::IncomeStatement;
    constexpr StatementKind BS = StatementKind::BalanceSheet;
    constexpr StatementKind CF = StatementKind::CashFlow;
    constexpr StatementKind RT = StatementKind::Ratios;
    constexpr MetricKind FLOW = MetricKind::Flow;
    constexpr MetricKind STOCK = MetricKind::Stock;

    FieldCatalog catalog;

    // Income statement
    catalog.add({NET_INCOME, IS, FLOW,
        {"Net Profit For the Year", "Lợi nhuận sau thuế", "Net profit after tax",
         "Profit after tax", "Net income", "net_income", "netIncome"}});
    catalog.add({REVENUE, IS, FLOW,
        {"Revenue (Bn. VND)", "Doanh thu thuần", "Net sales", "Revenue", "netRevenue",
         "totalRevenue"}});
    catalog.add({GROSS_PROFIT, IS, FLOW,
        {"Gross Profit", "Lợi nhuận gộp", "gross_profit", "grossProfit"}});
    catalog.add({SELLING_EXPENSES, IS, FLOW,
        {"Selling Expenses", "Chi phí bán hàng", "selling_expenses", "sellingExpenses"}});
    catalog.add({ADMIN_EXPENSES, IS, FLOW,
        {"General & Admin Expenses", "Chi phí quản lý doanh nghiệp", "admin_expenses",
         "adminExpenses", "general_admin_expenses"}});
    catalog.add({EBIT, IS, FLOW,
        {"Operating Profit/Loss", "Lợi nhuận từ hoạt động kinh doanh", "Operating income",
         "Operating profit", "operationProfit", "EBIT"}});
    catalog.add({EBITDA, IS, FLOW, {"EBITDA", "ebitda"}});
    catalog.add({INTEREST_EXPENSE, IS, FLOW,
        {"Interest Expenses", "Chi phí lãi vay", "interest_expense", "interestExpense"}});
    catalog.add({INCOME_TAX, IS, FLOW,
        {"Business income tax - current", "Chi phí thuế TNDN hiện hành", "Income tax",
         "income_tax", "incomeTax"}});

    // Balance sheet
    catalog.add({TOTAL_ASSETS, BS, STOCK,
        {"TOTAL ASSETS (Bn. VND)", "TỔNG CỘNG TÀI SẢN", "Total assets", "totalAsset",
         "totalAssets"}});
    catalog.add({TOTAL_LIABILITIES, BS, STOCK,
        {"LIABILITIES (Bn. VND)", "TỔNG CỘNG NỢ PHẢI TRẢ", "NỢ PHẢI TRẢ", "Total liabilities",
         "totalLiabilities"}});
    catalog.add({TOTAL_EQUITY, BS, STOCK,
        {"OWNER'S EQUITY(Bn.VND)", "VỐN CHỦ SỞ HỮU", "Owner's equity", "Total equity",
         "totalEquity"}});
    catalog.add({SHORT_TERM_DEBT, BS, STOCK,
        {"Short-term borrowings (Bn. VND)", "Vay và nợ thuê tài chính ngắn hạn",
         "Short-term borrowings", "shortTermBorrowings"}});
    catalog.add({LONG_TERM_DEBT, BS, STOCK,
        {"Long-term borrowings (Bn. VND)", "Vay và nợ thuê tài chính dài hạn",
         "Long-term borrowings", "longTermBorrowings"}});
    catalog.add({CASH, BS, STOCK,
        {"Cash and cash equivalents (Bn. VND)", "Tiền và tương đương tiền",
         "Cash and cash equivalents", "cashAndEquivalents", "Cash"}});
    catalog.add({CURRENT_ASSETS, BS, STOCK,
        {"CURRENT ASSETS (Bn. VND)", "TÀI SẢN NGẮN HẠN", "Current assets", "currentAssets"}});
    catalog.add({CURRENT_LIABILITIES, BS, STOCK,
        {"Current liabilities (Bn. VND)", "Nợ ngắn hạn", "Current liabilities",
         "currentLiabilities"}});
    catalog.add({INVENTORY, BS, STOCK,
        {"Net Inventories", "Hàng tồn kho", "Inventories", "inventory"}});
    catalog.add({ACCOUNTS_RECEIVABLE, BS, STOCK,
        {"Accounts receivable (Bn. VND)", "Các khoản phải thu ngắn hạn",
         "Accounts receivable", "accountsReceivable"}});
    catalog.add({FIXED_ASSETS, BS, STOCK,
        {"Fixed assets (Bn. VND)", "Tài sản cố định", "Fixed assets", "fixedAssets"}});

    // Cash flow statement
    catalog.add({DEPRECIATION, CF, FLOW,
        {"Depreciation and Amortisation", "Khấu hao tài sản cố định", "Depreciation",
         "depreciationAndAmortisation"}});
    catalog.add({PROVISIONS, CF, FLOW,
        {"Provision for credit losses", "Các khoản dự phòng", "Provisions", "provisions"}});
    catalog.add({OPERATING_CASH_FLOW, CF, FLOW,
        {"Net cash inflows/outflows from operating activities",
         "Lưu chuyển tiền thuần từ hoạt động kinh doanh", "Operating cash flow",
         "Cash from operations", "operatingCashFlow"}});
    catalog.add({CAPITAL_EXPENDITURE, CF, FLOW,
        {"Purchase of fixed assets", "Chi để mua sắm tài sản cố định",
         "Capital expenditure", "Capex", "capex"}});
    catalog.add({ASSET_DISPOSAL_PROCEEDS, CF, FLOW,
        {"Proceeds from disposal of fixed assets", "Tiền thu từ thanh lý tài sản cố định",
         "assetDisposalProceeds"}});
    catalog.add({BORROWING_PROCEEDS, CF, FLOW,
        {"Proceeds from borrowings", "Tiền thu từ đi vay", "borrowingProceeds"}});
    catalog.add({DEBT_REPAYMENTS, CF, FLOW,
        {"Repayment of borrowings", "Tiền trả nợ gốc vay", "debtRepayments"}});
    catalog.add({RECEIVABLES_CHANGE, CF, FLOW,
        {"Increase/Decrease in receivables", "Tăng, giảm các khoản phải thu",
         "receivablesChange"}});
    catalog.add({INVENTORIES_CHANGE, CF, FLOW,
        {"Increase/Decrease in inventories", "Tăng, giảm hàng tồn kho", "inventoriesChange"}});
    catalog.add({PAYABLES_CHANGE, CF, FLOW,
        {"Increase/Decrease in payables", "Tăng, giảm các khoản phải trả", "payablesChange"}});
    catalog.add({PREPAID_EXPENSES_CHANGE, CF, FLOW,
        {"Increase/Decrease in prepaid expenses", "Tăng, giảm chi phí trả trước",
         "prepaidExpensesChange"}});
    catalog.add({DIVIDEND_PER_SHARE, CF, FLOW,
        {"Dividends paid per share", "dividendPerShare"}});

    // Ratio table (two-level vendor headers are matched by name)
    catalog.add({EPS, RT, STOCK, {"EPS (VND)", "earningsPerShare", "earnings_per_share", "EPS"}});
    catalog.add({BOOK_VALUE_PER_SHARE, RT, STOCK,
        {"BVPS (VND)", "bookValue", "book_value_per_share", "BVPS"}});
    catalog.add({MARKET_CAP, RT, STOCK, {"Market Capital (Bn. VND)", "marketCap", "market_cap"}});
    catalog.add({EBITDA, RT, STOCK, {"EBITDA (Bn. VND)"}});
    catalog.add({PE_RATIO, RT, STOCK, {"P/E", "pe_ratio", "priceToEarning"}});
    catalog.add({PB_RATIO, RT, STOCK, {"P/B", "pb_ratio", "priceToBook"}});
    catalog.add({PS_RATIO, RT, STOCK, {"P/S", "ps_ratio", "priceToSales"}});
    catalog.add({EV_TO_EBITDA, RT, STOCK, {"EV/EBITDA", "ev_ebitda", "valueBeforeEbitda"}});
    catalog.add({ROE, RT, STOCK, {"ROE (%)", "roe"}, true});
    catalog.add({ROA, RT, STOCK, {"ROA (%)", "roa"}, true});
    catalog.add({GROSS_MARGIN, RT, STOCK, {"Gross Profit Margin (%)", "grossProfitMargin"}, true});
    catalog.add({EBIT_MARGIN, RT, STOCK, {"EBIT Margin (%)", "ebitMargin"}, true});
    catalog.add({NET_PROFIT_MARGIN, RT, STOCK,
        {"Net Profit Margin (%)", "postTaxMargin", "netProfitMargin"}, true});
    catalog.add({DEBT_TO_EQUITY, RT, STOCK, {"Debt/Equity", "debtOnEquity", "debt_to_equity"}});
    catalog.add({FINANCIAL_LEVERAGE, RT, STOCK, {"Financial Leverage", "financialLeverage"}});
    catalog.add({CURRENT_RATIO, RT, STOCK, {"Current Ratio", "currentPayment"}});
    catalog.add({QUICK_RATIO, RT, STOCK, {"Quick Ratio", "quickPayment"}});
    catalog.add({CASH_RATIO, RT, STOCK, {"Cash Ratio", "cashRatio"}});
    catalog.add({INTEREST_COVERAGE, RT, STOCK, {"Interest Coverage", "interestCoverage"}});
    catalog.add({ASSET_TURNOVER, RT, STOCK, {"Asset Turnover", "assetTurnover"}});
    catalog.add({INVENTORY_TURNOVER, RT, STOCK, {"Inventory Turnover", "inventoryTurnover"}});
    catalog.add({FIXED_ASSET_TURNOVER, RT, STOCK,
        {"Fixed Asset Turnover", "fixedAssetTurnover"}});
    catalog.add({DIVIDEND_PER_SHARE, RT, STOCK, {"Dividend per share", "dividend_per_share"}});

    return catalog;
}

// ============================================================================
// Catalog maintenance and lookup
// ============================================================================

void FieldCatalog::add(FieldSpec spec) {
    if (spec.metric.empty()) {
        throw std::invalid_argument("Field spec must name a metric");
    }
    if (spec.candidates.empty()) {
        throw std::invalid_argument("Field spec for " + spec.metric +
                                    " must have at least one candidate label");
    }
    specs_.push_back(std::move(spec));
}

size_t FieldCatalog::remove(const std::string& metric) {
    size_t before = specs_.size();
    specs_.erase(std::remove_if(specs_.begin(), specs_.end(),
                                [&](const FieldSpec& s) { return s.metric == metric; }),
                 specs_.end());
    return before - specs_.size();
}

const FieldSpec* FieldCatalog::find(const std::string& metric) const {
    for (const auto& spec : specs_) {
        if (spec.metric == metric) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<const FieldSpec*> FieldCatalog::find_all(const std::string& metric) const {
    std::vector<const FieldSpec*> out;
    for (const auto& spec : specs_) {
        if (spec.metric == metric) {
            out.push_back(&spec);
        }
    }
    return out;
}

// ============================================================================
// JSON overlay
// ============================================================================

namespace {

FieldSpec parse_field_spec(const std::string& metric, const json& j) {
    if (!j.is_object()) {
        throw ConfigParseError("Field spec for '" + metric + "' must be an object");
    }
    if (!j.contains("statement")) {
        throw ConfigParseError("Field spec for '" + metric + "' missing required field: statement");
    }
    if (!j.contains("candidates") || !j["candidates"].is_array()) {
        throw ConfigParseError("Field spec for '" + metric + "' missing candidate list");
    }

    FieldSpec spec;
    spec.metric = metric;
    try {
        spec.statement = statement_kind_from_string(j["statement"].get<std::string>());
        spec.kind = metric_kind_from_string(j.value("kind", std::string("stock")));
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError("Field spec for '" + metric + "': " + e.what());
    }
    spec.candidates = j["candidates"].get<FieldCandidateList>();
    spec.percent_scaled = j.value("percent_scaled", false);

    if (spec.candidates.empty()) {
        throw ConfigParseError("Field spec for '" + metric + "' has an empty candidate list");
    }
    return spec;
}

} // anonymous namespace

FieldCatalog FieldCatalog::load_from_json(const std::string& filepath) {
    return load_from_json(filepath, default_catalog());
}

FieldCatalog FieldCatalog::load_from_json(const std::string& filepath, const FieldCatalog& base) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open field catalog: " + filepath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_json(buffer.str(), base);
}

FieldCatalog FieldCatalog::parse_json(const std::string& json_string, const FieldCatalog& base) {
    FieldCatalog catalog = base;
    try {
        json j = json::parse(json_string);
        if (!j.is_object() || !j.contains("metrics") || !j["metrics"].is_object()) {
            throw ConfigParseError("Field catalog must contain a \"metrics\" object");
        }

        const json& entries = j["metrics"];
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            const std::string& metric = it.key();
            const json& entry = it.value();
            std::vector<FieldSpec> specs;
            if (entry.is_array()) {
                for (const auto& item : entry) {
                    specs.push_back(parse_field_spec(metric, item));
                }
            } else {
                specs.push_back(parse_field_spec(metric, entry));
            }
            if (specs.empty()) {
                throw ConfigParseError("Field catalog entry '" + metric + "' has no specs");
            }

            catalog.remove(metric);
            for (auto& spec : specs) {
                catalog.add(std::move(spec));
            }
        }
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
    return catalog;
}

// ============================================================================
// Extraction
// ============================================================================

AggregationMode aggregation_for(const FieldSpec& spec, ReportingFrequency frequency) {
    if (frequency == ReportingFrequency::Quarterly && spec.kind == MetricKind::Flow) {
        return AggregationMode::TrailingSum;
    }
    return AggregationMode::Latest;
}

double percent_to_fraction(double value) {
    return std::fabs(value) >= 1.0 ? value / 100.0 : value;
}

NormalizedMetrics extract_primitives(const StatementSet& statements,
                                     const MarketData& market,
                                     const FieldCatalog& catalog) {
    NormalizedMetrics metrics;
    ValuationContext ctx(market.symbol, "extract");
    Logger& logger = Logger::get_instance();

    // Direct quotes outrank anything the statements report
    if (market.current_price && *market.current_price > 0.0) {
        metrics.set_if_missing(metric::CURRENT_PRICE, market.current_price, MetricSource::Extracted);
    }
    if (market.shares_outstanding && *market.shares_outstanding > 0.0) {
        metrics.set_if_missing(metric::SHARES_OUTSTANDING, market.shares_outstanding,
                               MetricSource::Extracted);
    }

    for (const auto& spec : catalog.specs()) {
        if (metrics.has(spec.metric)) {
            continue;
        }

        const StatementTable& table = statements.get(spec.statement);
        auto value = resolve(table, spec.candidates, aggregation_for(spec, statements.frequency));
        if (!value) {
            logger.log_field_unresolved(ctx, spec.metric, statement_kind_to_string(spec.statement));
            continue;
        }

        if (spec.percent_scaled) {
            value = percent_to_fraction(*value);
        }
        metrics.set_if_missing(spec.metric, value, MetricSource::Extracted);
    }

    return metrics;
}

} // namespace fairvalue
