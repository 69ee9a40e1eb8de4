#include <pybind11/iostream.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <iostream>
#include <limits>
#include <optional>

#include "Collector.h"
#include "CompiledExpression.h"
#include "Criterion.h"
#include "ForestSimulator.h"
#include "Model.h"
#include "Output.h"
#include "Skyline.h"


namespace py = pybind11;
using namespace treesim;


static py::tuple summary_tuple(const ForestSummary& s) {
     return py::make_tuple(s.tips, s.unsampled, s.time);
}

static std::vector<std::string> newick_lines(const Forest& forest, const bool sampledOnly) {
     std::vector<std::string> lines;
     lines.reserve(forest.size());
     for (const Tree& tree : forest.trees()) {
          std::string nwk = toNewick(tree, sampledOnly);
          if (!nwk.empty()) lines.push_back(std::move(nwk));
     }
     return lines;
}


/**
 * Runs one generation with Python-owned criteria and collectors, merging collected data back into them.
 */
static py::tuple py_generate(const std::vector<Model>& models,
                             const std::vector<double>& skylineTimes,
                             const int minTips,
                             const int maxTips,
                             const double T,
                             const int maxNotifiedContacts,
                             const std::optional<uint64_t> seed,
                             const int64_t maxAttempts,
                             const std::vector<std::shared_ptr<Criterion>>& criteria,
                             const std::vector<std::shared_ptr<DataCollector>>& collectors) {
     RngEngine rng(seed ? *seed : RngEngine::defaultSeed());
     const CriterionGroup critGroup(criteria);
     const DataCollectorGroup collGroup(collectors);

     ForestSimulator simulator(makeSkyline(models, skylineTimes, maxNotifiedContacts), minTips, maxTips, T,
                               critGroup, collGroup, maxAttempts);
     GenerationResult result = simulator.run(rng);

     // the simulator appends its own LttCollector after the caller's
     const auto& owned = simulator.collectors();
     const size_t n = std::min(owned.size(), collectors.size());
     for (size_t i = 0; i < n; ++i)
          collectors[i]->merge(*owned.at(i));

     auto forest = std::make_shared<Forest>(std::move(result.forest));
     return py::make_tuple(forest, summary_tuple(result.summary), result.ltt);
}


PYBIND11_MODULE(_treesim, m) {
     m.doc() = "Skyline birth-death-sampling tree and forest simulator with contact notification";

     // Models
     py::class_<Model>(m, "Model")
          .def("birth_rate", &Model::birthRate)
          .def("removal_rate", &Model::removalRate, py::arg("notified") = false)
          .def("sampling_probability", &Model::samplingProbability)
          .def("notifies", &Model::notifies)
          .def("notification_probability", &Model::notificationProbability)
          .def("notified_removal_rate", &Model::notifiedRemovalRate)
          .def("max_notified_contacts", &Model::maxNotifiedContacts)
          .def("__repr__", &Model::describe);

     m.def("BirthDeathModel",
           [](const double la, const double psi, const double p, const double avgRecipients) {
                const RecipientDistribution recipients = avgRecipients == 1.0
                                                              ? RecipientDistribution::single()
                                                              : RecipientDistribution::withMean(avgRecipients);
                return Model(RateModel(la, psi, p, recipients));
           },
           py::arg("la"),
           py::arg("psi"),
           py::arg("p"),
           py::arg("avg_recipients") = 1.0,
           "Birth-death-sampling model with transmission rate la, removal rate psi and sampling probability p.");

     m.def("CTModel",
           [](const Model& model, const double upsilon, const double phi) {
                return Model(model.base(), Notification(upsilon, phi, 1));
           },
           py::arg("model"),
           py::arg("upsilon"),
           py::arg("phi"),
           "Adds contact notification (probability upsilon, notified removal rate phi) to a model. "
           "The contact cap is set per run by generate(max_notified_contacts=...).");

     py::class_<Skyline, std::shared_ptr<Skyline>>(m, "Skyline")
          .def(py::init<std::vector<Model>, std::vector<double>>(),
               py::arg("models"),
               py::arg("times")
          )
          .def("__len__", &Skyline::size)
          .def("model_at", &Skyline::modelAt, py::arg("t"))
          .def("next_switch", &Skyline::nextSwitch, py::arg("t"));

     py::class_<CompiledExpression>(m, "CompiledExpression")
          .def(py::init<std::string>());

     // Criterion base + subclasses
     py::class_<Criterion, std::shared_ptr<Criterion>>(m, "Criterion");

     py::class_<IntervalCriterion, Criterion, std::shared_ptr<IntervalCriterion>>(m, "IntervalCriterion")
          .def(py::init<double, double, int, int>(),
               py::arg("t_min"),
               py::arg("t_max"),
               py::arg("min_allowed"),
               py::arg("max_allowed")
          );

     py::class_<ExpressionCriterion, Criterion, std::shared_ptr<ExpressionCriterion>>(m, "ExpressionCriterion")
          .def(py::init([](const std::string& expr) {
                    return std::make_shared<ExpressionCriterion>(CompiledExpression(expr));
               }),
               py::arg("expr"),
               "Accept forests for which expr (over tips, unsampled, hidden, notified, trees, time) is nonzero."
          );

     // DataCollector base + subclasses
     py::class_<DataCollector, std::shared_ptr<DataCollector>>(m, "DataCollector");

     py::class_<LttCollector, DataCollector, std::shared_ptr<LttCollector>>(m, "LttCollector")
          .def(py::init<>())
          .def("curves", &LttCollector::curves, py::return_value_policy::reference_internal);

     py::class_<ActiveSetSizeCollector, DataCollector, std::shared_ptr<ActiveSetSizeCollector>>(
               m, "ActiveSetSizeCollector")
          .def(py::init<double>(), py::arg("collection_time"))
          .def("active_set_sizes", &ActiveSetSizeCollector::activeSetSizes);

     py::class_<AttemptCollector, DataCollector, std::shared_ptr<AttemptCollector>>(m, "AttemptCollector")
          .def(py::init<>())
          .def("accepted", [](const AttemptCollector& c) { return c.count(TrajectoryResult::ACCEPTED); })
          .def("extinct", [](const AttemptCollector& c) { return c.count(TrajectoryResult::EXTINCT); })
          .def("rejected", [](const AttemptCollector& c) {
               return c.count(TrajectoryResult::EARLY_REJECTED) + c.count(TrajectoryResult::REJECTED_BY_CRITERION);
          })
          .def("total", &AttemptCollector::total);

     py::class_<ProgressLogger, DataCollector, std::shared_ptr<ProgressLogger>>(m, "ProgressLogger")
          .def(py::init([](const bool verbose) { return std::make_shared<ProgressLogger>(std::cerr, verbose); }),
               py::arg("verbose") = false,
               "Logs generation progress to stderr.");

     // Forest
     py::class_<Forest, std::shared_ptr<Forest>>(m, "Forest")
          .def("__len__", &Forest::size)
          .def_property_readonly("total_tips", &Forest::totalTips)
          .def_property_readonly("unsampled", &Forest::unsampled)
          .def_property_readonly("hidden_trees", &Forest::hiddenTrees)
          .def_property_readonly("time", &Forest::time)
          .def("newick", &newick_lines, py::arg("sampled_only") = false);

     // Generation
     m.def("generate", &py_generate,
           py::arg("models"),
           py::arg("skyline_times"),
           py::arg("min_tips"),
           py::arg("max_tips"),
           py::arg("T") = std::numeric_limits<double>::infinity(),
           py::arg("max_notified_contacts") = 1,
           py::arg("seed") = py::none(),
           py::arg("max_attempts") = 0,
           py::arg("criteria") = std::vector<std::shared_ptr<Criterion>>{},
           py::arg("collectors") = std::vector<std::shared_ptr<DataCollector>>{},
           py::call_guard<py::scoped_estream_redirect>(),
           "Generate a tree (T=inf) or a forest; returns (forest, (total_tips, unsampled, time), ltt).");

     // Output
     m.def("observed_ltt", &observedLtt, py::arg("forest"));

     m.def("save_forest", &saveForest,
           py::arg("forest"),
           py::arg("path"),
           py::arg("sampled_only") = false);

     m.def("save_log",
           [](const std::vector<Model>& models, const std::vector<double>& times, const Forest& forest,
              const std::string& path, const int maxNotifiedContacts) {
                saveLog(makeSkyline(models, times, maxNotifiedContacts), forest.summary(), path);
           },
           py::arg("models"),
           py::arg("skyline_times"),
           py::arg("forest"),
           py::arg("path"),
           py::arg("max_notified_contacts") = 1);

     m.def("save_ltt", &saveLtt,
           py::arg("ltt"),
           py::arg("observed"),
           py::arg("path"));
}
