#include "evalign/evaluation.hpp"
#include "evalign/interval.hpp"

#include <algorithm>

namespace evalign {

namespace {

Evaluation run_matcher(Evaluation ev, const EvaluationOptions& options) {
    auto matcher = make_matcher(options.matcher);
    ev.matcher = matcher->name();
    ev.records = matcher->match(ev.generated, ev.reference);
    ev.coverage = compute_coverage(ev.generated, ev.reference, ev.records);
    ev.counts = count_records(ev.records);
    return ev;
}

}  // namespace

Evaluation evaluate_files(const std::string& generated_path,
                          const std::string& reference_path,
                          const EvaluationOptions& options) {
    EventTableOptions gen_opts;
    gen_opts.filter_speech_type = false;

    Evaluation ev;
    ev.generated_path = generated_path;
    ev.reference_path = reference_path;
    ev.generated = read_events(generated_path, gen_opts);

    EventTableOptions ref_opts;
    ref_opts.filter_speech_type = options.filter_speech_type;
    if (options.range_filter) {
        ref_opts.time_range = time_range(ev.generated);
    }
    ev.reference = read_events(reference_path, ref_opts);

    return run_matcher(std::move(ev), options);
}

Evaluation evaluate_events(std::vector<Event> generated,
                           std::vector<Event> reference,
                           const EvaluationOptions& options) {
    Evaluation ev;
    ev.generated = std::move(generated);

    if (options.range_filter) {
        const auto range = time_range(ev.generated);
        reference.erase(std::remove_if(reference.begin(), reference.end(),
                                       [&](const Event& r) {
                                           return !(r.start <= range.second &&
                                                    r.end >= range.first);
                                       }),
                        reference.end());
    }
    ev.reference = std::move(reference);

    return run_matcher(std::move(ev), options);
}

}  // namespace evalign
