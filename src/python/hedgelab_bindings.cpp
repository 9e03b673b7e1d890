// SPDX-License-Identifier: MIT
/**
 * @file hedgelab_bindings.cpp
 * @brief Python bindings for the hedgelab core using pybind11
 *
 * Records are returned as dicts and observations as float64 numpy arrays,
 * matching what a Gymnasium-style training harness expects.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <sstream>
#include "hedgelab/option/option_spec.hpp"
#include "hedgelab/option/european_option.hpp"
#include "hedgelab/hedging/hedge_strategy.hpp"
#include "hedgelab/env/hedging_env.hpp"
#include "hedgelab/env/reward_functions.hpp"
#include "hedgelab/evaluation/hedging_evaluator.hpp"
#include "hedgelab/evaluation/agent_evaluator.hpp"
#include "hedgelab/evaluation/performance_metrics.hpp"

namespace py = pybind11;

namespace {

py::dict record_to_dict(const hedgelab::Record& record) {
    py::dict d;
    for (const auto& [key, value] : record) {
        d[py::str(key)] = std::visit([](const auto& v) -> py::object { return py::cast(v); }, value);
    }
    return d;
}

py::dict greeks_to_dict(const hedgelab::Greeks& g) {
    py::dict d;
    d["delta"] = g.delta;
    d["gamma"] = g.gamma;
    d["vega"] = g.vega;
    d["theta"] = g.theta;
    d["rho"] = g.rho;
    return d;
}

py::array_t<double> observation_to_array(const hedgelab::Observation& obs) {
    return py::array_t<double>(obs.size(), obs.data());
}

// Translate a ValidationError into ValueError
[[noreturn]] void throw_validation_error(const hedgelab::ValidationError& err) {
    std::ostringstream msg;
    msg << "Invalid argument: " << hedgelab::to_string(err.code)
        << " (value=" << err.value << ", index=" << err.index << ")";
    throw py::value_error(msg.str());
}

template <typename T>
T unwrap(std::expected<T, hedgelab::ValidationError> result) {
    if (!result) {
        throw_validation_error(result.error());
    }
    return std::move(*result);
}

hedgelab::OptionType to_option_type(const py::object& obj) {
    if (py::isinstance<py::str>(obj)) {
        return unwrap(hedgelab::parse_option_type(obj.cast<std::string>()));
    }
    return obj.cast<hedgelab::OptionType>();
}

// Step info with the Greeks nested under "greeks"
py::dict info_to_dict(const hedgelab::StepInfo& info) {
    py::dict d = record_to_dict(info.to_record());
    d["greeks"] = greeks_to_dict(info.greeks);
    return d;
}

py::tuple step_result_to_tuple(const hedgelab::StepResult& r) {
    return py::make_tuple(observation_to_array(r.observation), r.reward,
                          r.terminated, r.truncated, info_to_dict(r.info));
}

// Accepts Python ints, numpy integers and one-element arrays
size_t to_discrete_index(const py::object& action) {
    double value;
    if (py::isinstance(action, py::module_::import("numbers").attr("Integral"))) {
        value = py::float_(py::int_(action)).cast<double>();
    } else {
        auto values = py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(action);
        if (!values || values.size() != 1) {
            throw py::value_error("discrete action must be a single integer index");
        }
        value = *values.data();
    }
    return unwrap(hedgelab::discrete_action_index(value));
}

}  // namespace

PYBIND11_MODULE(hedgelab, m) {
    m.doc() = "Python bindings for hedgelab option hedging simulation and backtesting";

    py::enum_<hedgelab::OptionType>(m, "OptionType")
        .value("CALL", hedgelab::OptionType::CALL)
        .value("PUT", hedgelab::OptionType::PUT);

    py::enum_<hedgelab::ActionMode>(m, "ActionMode")
        .value("CONTINUOUS", hedgelab::ActionMode::Continuous)
        .value("DISCRETE", hedgelab::ActionMode::Discrete);

    py::enum_<hedgelab::EnvState>(m, "EnvState")
        .value("UNINITIALIZED", hedgelab::EnvState::Uninitialized)
        .value("ACTIVE", hedgelab::EnvState::Active)
        .value("TERMINATED", hedgelab::EnvState::Terminated);

    // =========================================================================
    // Pricing
    // =========================================================================

    m.def("price",
        [](double spot, double strike, double maturity, double rate, double volatility,
           const py::object& option_type) {
            return hedgelab::bs_price(spot, strike, maturity, rate, volatility,
                                      to_option_type(option_type));
        },
        py::arg("spot"), py::arg("strike"), py::arg("maturity"), py::arg("rate"),
        py::arg("volatility"), py::arg("option_type") = "call",
        "Black-Scholes price; intrinsic value when maturity <= 0");

    m.def("greeks",
        [](double spot, double strike, double maturity, double rate, double volatility,
           const py::object& option_type) {
            return greeks_to_dict(hedgelab::bs_greeks(spot, strike, maturity, rate, volatility,
                                                      to_option_type(option_type)));
        },
        py::arg("spot"), py::arg("strike"), py::arg("maturity"), py::arg("rate"),
        py::arg("volatility"), py::arg("option_type") = "call",
        "Black-Scholes Greeks (vega/rho per 1%, theta per day)");

    // =========================================================================
    // Reward models
    // =========================================================================

    py::class_<hedgelab::DefaultReward>(m, "DefaultReward")
        .def(py::init<>());

    py::class_<hedgelab::StandardReward>(m, "StandardReward")
        .def(py::init<>())
        .def_readwrite("pnl_scale", &hedgelab::StandardReward::pnl_scale);

    py::class_<hedgelab::AsymmetricReward>(m, "AsymmetricReward")
        .def(py::init<>())
        .def_readwrite("loss_multiplier", &hedgelab::AsymmetricReward::loss_multiplier)
        .def_readwrite("gain_multiplier", &hedgelab::AsymmetricReward::gain_multiplier)
        .def_readwrite("pnl_scale", &hedgelab::AsymmetricReward::pnl_scale);

    py::class_<hedgelab::CVaRReward>(m, "CVaRReward")
        .def(py::init<>())
        .def_readwrite("alpha", &hedgelab::CVaRReward::alpha)
        .def_readwrite("lambda_cvar", &hedgelab::CVaRReward::lambda_cvar)
        .def_readwrite("window", &hedgelab::CVaRReward::window)
        .def_readwrite("pnl_scale", &hedgelab::CVaRReward::pnl_scale);

    py::class_<hedgelab::SharpeReward>(m, "SharpeReward")
        .def(py::init<>())
        .def_readwrite("window", &hedgelab::SharpeReward::window)
        .def_readwrite("target_sharpe", &hedgelab::SharpeReward::target_sharpe);

    py::class_<hedgelab::VariancePenalizedReward>(m, "VariancePenalizedReward")
        .def(py::init<>())
        .def_readwrite("variance_penalty", &hedgelab::VariancePenalizedReward::variance_penalty)
        .def_readwrite("window", &hedgelab::VariancePenalizedReward::window);

    py::class_<hedgelab::CompositeReward>(m, "CompositeReward")
        .def(py::init<>())
        .def(py::init([](std::vector<std::pair<hedgelab::RewardComponent, double>> components) {
            return hedgelab::CompositeReward{std::move(components)};
        }), py::arg("components"))
        .def_readwrite("components", &hedgelab::CompositeReward::components);

    // =========================================================================
    // Environment
    // =========================================================================

    py::class_<hedgelab::EnvironmentConfig>(m, "EnvironmentConfig")
        .def(py::init<>())
        .def_readwrite("spot", &hedgelab::EnvironmentConfig::spot)
        .def_readwrite("strike", &hedgelab::EnvironmentConfig::strike)
        .def_readwrite("maturity", &hedgelab::EnvironmentConfig::maturity)
        .def_readwrite("rate", &hedgelab::EnvironmentConfig::rate)
        .def_readwrite("volatility", &hedgelab::EnvironmentConfig::volatility)
        .def_readwrite("n_steps", &hedgelab::EnvironmentConfig::n_steps)
        .def_readwrite("option_type", &hedgelab::EnvironmentConfig::option_type)
        .def_readwrite("action_mode", &hedgelab::EnvironmentConfig::action_mode)
        .def_readwrite("transaction_cost", &hedgelab::EnvironmentConfig::transaction_cost)
        .def_readwrite("risk_penalty", &hedgelab::EnvironmentConfig::risk_penalty)
        .def_readwrite("reward", &hedgelab::EnvironmentConfig::reward);

    py::class_<hedgelab::HedgingEnvironment>(m, "HedgingEnvironment")
        .def(py::init([](const hedgelab::EnvironmentConfig& config) {
            return unwrap(hedgelab::HedgingEnvironment::create(config));
        }), py::arg("config") = hedgelab::EnvironmentConfig{})
        .def("reset",
            [](hedgelab::HedgingEnvironment& self, std::optional<uint64_t> seed) {
                auto r = self.reset(seed);
                return py::make_tuple(observation_to_array(r.observation),
                                      info_to_dict(r.info));
            },
            py::arg("seed") = py::none(),
            R"pbdoc(
                Start a new episode.

                Returns:
                    Tuple of (observation: ndarray[11], info: dict)
            )pbdoc")
        .def("step",
            [](hedgelab::HedgingEnvironment& self, const py::object& action) {
                if (self.config().action_mode == hedgelab::ActionMode::Discrete) {
                    return step_result_to_tuple(unwrap(self.step(to_discrete_index(action))));
                }
                auto values = py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(action);
                if (!values) {
                    throw py::type_error("action must be an int or a sequence of floats");
                }
                std::span<const double> span(values.data(), static_cast<size_t>(values.size()));
                return step_result_to_tuple(unwrap(self.step(span)));
            },
            py::arg("action"),
            R"pbdoc(
                Advance one hedging step.

                Args:
                    action: [target_position] in continuous mode; in discrete mode an
                        integer index (int or numpy integer) into the adjustment table

                Returns:
                    Tuple of (observation, reward, terminated, truncated, info)

                Raises:
                    ValueError: Before reset(), after termination, or on a malformed action
            )pbdoc")
        .def("episode_metrics",
            [](const hedgelab::HedgingEnvironment& self) {
                return record_to_dict(self.episode_metrics());
            })
        .def_property_readonly("state", &hedgelab::HedgingEnvironment::state)
        .def_property_readonly("current_step", &hedgelab::HedgingEnvironment::current_step)
        .def_property_readonly("dt", &hedgelab::HedgingEnvironment::dt)
        .def_property_readonly("spot", &hedgelab::HedgingEnvironment::spot)
        .def_property_readonly("position", &hedgelab::HedgingEnvironment::position)
        .def_property_readonly("cash", &hedgelab::HedgingEnvironment::cash)
        .def_property_readonly("pnl", &hedgelab::HedgingEnvironment::pnl)
        .def_property_readonly("total_costs", &hedgelab::HedgingEnvironment::total_costs)
        .def_property_readonly("initial_premium", &hedgelab::HedgingEnvironment::initial_premium)
        .def_property_readonly("price_history", &hedgelab::HedgingEnvironment::price_history)
        .def_property_readonly("position_history", &hedgelab::HedgingEnvironment::position_history)
        .def_property_readonly("pnl_history", &hedgelab::HedgingEnvironment::pnl_history);

    // =========================================================================
    // Baseline strategies
    // =========================================================================

    py::class_<hedgelab::StrategyConfig>(m, "StrategyConfig")
        .def(py::init<>())
        .def_readwrite("spot", &hedgelab::StrategyConfig::spot)
        .def_readwrite("strike", &hedgelab::StrategyConfig::strike)
        .def_readwrite("maturity", &hedgelab::StrategyConfig::maturity)
        .def_readwrite("rate", &hedgelab::StrategyConfig::rate)
        .def_readwrite("volatility", &hedgelab::StrategyConfig::volatility)
        .def_readwrite("option_type", &hedgelab::StrategyConfig::option_type)
        .def_readwrite("transaction_cost", &hedgelab::StrategyConfig::transaction_cost);

    py::class_<hedgelab::DeltaParams>(m, "DeltaParams")
        .def(py::init<>());

    py::class_<hedgelab::DeltaGammaParams>(m, "DeltaGammaParams")
        .def(py::init<>())
        .def_readwrite("gamma_target", &hedgelab::DeltaGammaParams::gamma_target);

    py::class_<hedgelab::DeltaGammaVegaParams>(m, "DeltaGammaVegaParams")
        .def(py::init<>())
        .def_readwrite("gamma_weight", &hedgelab::DeltaGammaVegaParams::gamma_weight)
        .def_readwrite("vega_weight", &hedgelab::DeltaGammaVegaParams::vega_weight);

    py::class_<hedgelab::MinimumVarianceParams>(m, "MinimumVarianceParams")
        .def(py::init<>())
        .def_readwrite("lookback_window", &hedgelab::MinimumVarianceParams::lookback_window);

    py::class_<hedgelab::HedgingStrategy>(m, "HedgingStrategy")
        .def(py::init([](const hedgelab::StrategyConfig& config, const hedgelab::StrategyParams& params) {
            return unwrap(hedgelab::HedgingStrategy::create(config, params));
        }), py::arg("config"), py::arg("params") = hedgelab::StrategyParams{hedgelab::DeltaParams{}})
        .def("initialize", &hedgelab::HedgingStrategy::initialize,
             "Sell the option and place the initial hedge; returns the premium")
        .def("rebalance",
            [](hedgelab::HedgingStrategy& self, double spot, double tau) {
                return record_to_dict(self.rebalance(spot, tau).to_record());
            }, py::arg("spot"), py::arg("tau"))
        .def("portfolio_value",
            [](const hedgelab::HedgingStrategy& self, double spot, double tau) {
                return record_to_dict(self.portfolio_value(spot, tau).to_record());
            }, py::arg("spot"), py::arg("tau"))
        .def("hedge_positions",
            [](hedgelab::HedgingStrategy& self, double spot, double tau) {
                py::dict d;
                d["stock"] = self.hedge_positions(spot, tau).stock;
                return d;
            }, py::arg("spot"), py::arg("tau"))
        .def_property_readonly("name", [](const hedgelab::HedgingStrategy& self) {
            return std::string(hedgelab::to_string(self.kind()));
        })
        .def_property_readonly("cash", &hedgelab::HedgingStrategy::cash)
        .def_property_readonly("stock_position", &hedgelab::HedgingStrategy::stock_position)
        .def_property_readonly("option_position", &hedgelab::HedgingStrategy::option_position)
        .def_property_readonly("total_costs", &hedgelab::HedgingStrategy::total_costs);

    // =========================================================================
    // Evaluation
    // =========================================================================

    py::class_<hedgelab::EvaluatorConfig>(m, "EvaluatorConfig")
        .def(py::init<>())
        .def_readwrite("spot", &hedgelab::EvaluatorConfig::spot)
        .def_readwrite("strike", &hedgelab::EvaluatorConfig::strike)
        .def_readwrite("maturity", &hedgelab::EvaluatorConfig::maturity)
        .def_readwrite("rate", &hedgelab::EvaluatorConfig::rate)
        .def_readwrite("volatility", &hedgelab::EvaluatorConfig::volatility)
        .def_readwrite("n_steps", &hedgelab::EvaluatorConfig::n_steps)
        .def_readwrite("option_type", &hedgelab::EvaluatorConfig::option_type);

    py::class_<hedgelab::BacktestResult>(m, "BacktestResult")
        .def_readonly("strategy_name", &hedgelab::BacktestResult::strategy_name)
        .def_readonly("num_episodes", &hedgelab::BacktestResult::num_episodes)
        .def_readonly("mean_pnl", &hedgelab::BacktestResult::mean_pnl)
        .def_readonly("std_pnl", &hedgelab::BacktestResult::std_pnl)
        .def_readonly("win_rate", &hedgelab::BacktestResult::win_rate)
        .def("to_dict", [](const hedgelab::BacktestResult& self) {
            return record_to_dict(self.to_record());
        })
        .def("episodes", [](const hedgelab::BacktestResult& self) {
            py::list out;
            for (const auto& ep : self.episodes) {
                out.append(record_to_dict(ep.to_record()));
            }
            return out;
        });

    py::class_<hedgelab::HedgingEvaluator>(m, "HedgingEvaluator")
        .def(py::init([](const hedgelab::EvaluatorConfig& config) {
            return unwrap(hedgelab::HedgingEvaluator::create(config));
        }), py::arg("config") = hedgelab::EvaluatorConfig{})
        .def("simulate_price_path",
            [](const hedgelab::HedgingEvaluator& self, uint64_t seed) {
                auto path = self.simulate_price_path(seed);
                return py::array_t<double>(path.size(), path.data());
            }, py::arg("seed"))
        .def("strategy_config", &hedgelab::HedgingEvaluator::strategy_config,
             py::arg("transaction_cost") = 0.001)
        .def("evaluate_strategy",
            [](const hedgelab::HedgingEvaluator& self, hedgelab::HedgingStrategy& strategy,
               const std::vector<double>& price_path, const std::string& name) {
                return record_to_dict(unwrap(self.evaluate_strategy(strategy, price_path, name)).to_record());
            }, py::arg("strategy"), py::arg("price_path"), py::arg("strategy_name"))
        .def("backtest_strategy",
            [](const hedgelab::HedgingEvaluator& self, const hedgelab::StrategyConfig& config,
               const hedgelab::StrategyParams& params, const std::string& name,
               size_t num_episodes, uint64_t seed) {
                py::gil_scoped_release release;
                return unwrap(self.backtest_strategy(config, params, name, num_episodes, seed));
            },
            py::arg("config"), py::arg("params"), py::arg("strategy_name"),
            py::arg("num_episodes") = 100, py::arg("seed") = 0)
        .def("compare_strategies",
            [](const hedgelab::HedgingEvaluator& self,
               const std::vector<std::tuple<hedgelab::StrategyConfig, hedgelab::StrategyParams, std::string>>& entries,
               size_t num_episodes, uint64_t seed) {
                std::vector<hedgelab::StrategyEntry> strategies;
                for (const auto& [config, params, name] : entries) {
                    strategies.push_back(hedgelab::StrategyEntry{config, params, name});
                }
                auto results = unwrap(self.compare_strategies(strategies, num_episodes, seed));
                py::list out;
                for (const auto& r : results) {
                    out.append(record_to_dict(r.to_record()));
                }
                return out;
            },
            py::arg("strategies"), py::arg("num_episodes") = 100, py::arg("seed") = 0,
            R"pbdoc(
                Backtest each (config, params, name) entry.

                Returns:
                    List of summary dicts sorted by mean_pnl, best first
            )pbdoc");

    m.def("sharpe_ratio", [](const std::vector<double>& r, double rf) {
        return hedgelab::sharpe_ratio(r, rf);
    }, py::arg("returns"), py::arg("risk_free_rate") = 0.0);
    m.def("sortino_ratio", [](const std::vector<double>& r, double rf) {
        return hedgelab::sortino_ratio(r, rf);
    }, py::arg("returns"), py::arg("risk_free_rate") = 0.0);
    m.def("max_drawdown", [](const std::vector<double>& pnl) {
        return hedgelab::max_drawdown(pnl);
    }, py::arg("pnl"));
    m.def("value_at_risk", [](const std::vector<double>& r, double confidence) {
        return hedgelab::value_at_risk(r, confidence);
    }, py::arg("returns"), py::arg("confidence") = 0.95);
    m.def("conditional_value_at_risk", [](const std::vector<double>& r, double confidence) {
        return hedgelab::conditional_value_at_risk(r, confidence);
    }, py::arg("returns"), py::arg("confidence") = 0.95);
    m.def("hedge_effectiveness", [](const std::vector<double>& hedged, const std::vector<double>& unhedged) {
        return hedgelab::hedge_effectiveness(hedged, unhedged);
    }, py::arg("hedged_pnl"), py::arg("unhedged_pnl"));
}
