#pragma once

namespace roll {

enum class OptionKind { Call, Put };

enum class ExerciseStyle { European, American };

struct OptionSpec {
    double S;
    double K;
    double r;
    double q;
    double T;
    double vol;
    OptionKind kind = OptionKind::Call;
    ExerciseStyle style = ExerciseStyle::European;

    bool is_call() const { return kind == OptionKind::Call; }
    bool is_american() const { return style == ExerciseStyle::American; }
};

} // namespace roll
