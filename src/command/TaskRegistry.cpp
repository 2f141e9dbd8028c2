#include "command/TaskRegistry.h"
#include "control/PatternMotion.h"

#include <cmath>
#include <utility>

namespace TaskRegistry {

    namespace {

        enum class Fetch {
            FOUND,
            MISSING,
            WRONG_TYPE,
            NOT_FINITE
        };

        bool isFinite(double v) { return std::isfinite(v); }
        bool isFinite(const std::string&) { return true; }

        template<typename T>
        Fetch fetch(const TaskParameters& params, const std::string& key, T& out) {
            auto it = params.find(key);
            if (it == params.end()) return Fetch::MISSING;
            const T* value = std::get_if<T>(&it->second);
            if (!value) return Fetch::WRONG_TYPE;
            if (!isFinite(*value)) return Fetch::NOT_FINITE;
            out = *value;
            return Fetch::FOUND;
        }

        const char* typeName(const double*) { return "number"; }
        const char* typeName(const std::string*) { return "string"; }

        // Collects the first schema problem; later fetches become no-ops.
        class ParamReader {
        public:
            explicit ParamReader(const TaskParameters& p) : params(p) {}

            template<typename T>
            T required(const std::string& key) {
                T value{};
                check(fetch(params, key, value), key, static_cast<const T*>(nullptr), true);
                return value;
            }

            template<typename T>
            T optional(const std::string& key, T fallback) {
                T value = fallback;
                Fetch f = fetch(params, key, value);
                check(f, key, static_cast<const T*>(nullptr), false);
                return f == Fetch::FOUND ? value : fallback;
            }

            void fail(const std::string& msg) {
                if (problem.empty()) problem = msg;
            }

            bool failed() const { return !problem.empty(); }
            const std::string& error() const { return problem; }

        private:
            const TaskParameters& params;
            std::string problem;

            template<typename T>
            void check(Fetch f, const std::string& key, const T* tag, bool isRequired) {
                if (f == Fetch::MISSING && isRequired) {
                    fail("missing parameter '" + key + "'");
                }
                else if (f == Fetch::WRONG_TYPE) {
                    fail("parameter '" + key + "' must be a " + typeName(tag));
                }
                else if (f == Fetch::NOT_FINITE) {
                    fail("parameter '" + key + "' must be finite");
                }
            }
        };

        Task parseMove(ParamReader& in, const SimulationConfig&) {
            double x = in.required<double>("x");
            double y = in.required<double>("y");
            return MoveTask{ Vec2(x, y) };
        }

        Task parsePatrol(ParamReader& in, const SimulationConfig& cfg) {
            std::string shape = in.optional<std::string>("pattern", "circle");
            double direction = in.optional<double>("direction", 1.0);
            int sign = direction < 0.0 ? -1 : 1;

            PatrolTask task;
            if (shape == "circle") {
                double cx = in.required<double>("center_x");
                double cy = in.required<double>("center_y");
                double radius = in.optional<double>("radius", cfg.defaultPatrolRadius);
                if (!in.failed() && radius <= 0.0) {
                    in.fail("parameter 'radius' must be > 0");
                }
                task.pattern = PatternMotion::makeCircle(Vec2(cx, cy), radius, 0.0, sign);
            }
            else if (shape == "bounce_x" || shape == "bounce_y") {
                double lo = in.required<double>("min");
                double hi = in.required<double>("max");
                if (!in.failed() && lo >= hi) {
                    in.fail("parameter 'min' must be < 'max'");
                }
                PatternKind axis = (shape == "bounce_x") ? PatternKind::BOUNCE_X : PatternKind::BOUNCE_Y;
                task.pattern = PatternMotion::makeBounce(axis, lo, hi, sign);
            }
            else {
                in.fail("unknown patrol pattern '" + shape + "'");
            }
            return task;
        }

        Task parseTail(ParamReader& in, const SimulationConfig& cfg) {
            TailTask task;
            task.targetId = in.required<std::string>("target_id");
            task.distance = in.optional<double>("distance", cfg.defaultTailDistance);
            if (!in.failed() && task.distance < 0.0) {
                in.fail("parameter 'distance' must be >= 0");
            }
            return task;
        }

        Task parseHold(ParamReader&, const SimulationConfig&) {
            return HoldTask{};
        }

        Task parseReturn(ParamReader& in, const SimulationConfig&) {
            ReturnToBaseTask task;
            std::string base = in.optional<std::string>("base_id", "");
            if (!base.empty()) task.baseId = base;
            return task;
        }

        Task parseIntercept(ParamReader& in, const SimulationConfig&) {
            return InterceptTask{ in.required<std::string>("target_id") };
        }

        using Parser = Task(*)(ParamReader&, const SimulationConfig&);

        struct Entry {
            std::string name;
            TaskKind kind;
            Parser parser;
        };

        const std::vector<Entry>& registry() {
            static const std::vector<Entry> entries = {
                { "move",           TaskKind::MOVE,           &parseMove },
                { "patrol",         TaskKind::PATROL,         &parsePatrol },
                { "tail",           TaskKind::TAIL,           &parseTail },
                { "hold",           TaskKind::HOLD,           &parseHold },
                { "return_to_base", TaskKind::RETURN_TO_BASE, &parseReturn },
                { "intercept",      TaskKind::INTERCEPT,      &parseIntercept },
            };
            return entries;
        }

        const Entry* find(const std::string& name) {
            for (const auto& e : registry()) {
                if (e.name == name) return &e;
            }
            return nullptr;
        }

    } // anonymous namespace

    const std::vector<std::string>& names() {
        static const std::vector<std::string> all = [] {
            std::vector<std::string> out;
            for (const auto& e : registry()) out.push_back(e.name);
            return out;
        }();
        return all;
    }

    std::optional<TaskKind> lookup(const std::string& name) {
        const Entry* e = find(name);
        if (!e) return std::nullopt;
        return e->kind;
    }

    TaskParseResult parse(const TaskRequest& request, const SimulationConfig& cfg) {
        TaskParseResult result;

        const Entry* entry = find(request.taskName);
        if (!entry) {
            result.error = CommandResult::rejected(CommandError::UNKNOWN_TASK,
                "unknown task '" + request.taskName + "'");
            return result;
        }

        if (request.droneIds.empty()) {
            result.error = CommandResult::rejected(CommandError::SCHEMA,
                "task '" + entry->name + "' needs at least one drone id");
            return result;
        }

        ParamReader reader(request.parameters);
        Task task = entry->parser(reader, cfg);

        if (reader.failed()) {
            result.error = CommandResult::rejected(CommandError::SCHEMA,
                entry->name + ": " + reader.error());
            return result;
        }

        result.task = std::move(task);
        return result;
    }

} // namespace TaskRegistry
