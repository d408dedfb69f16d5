#ifndef FATHOM_COMMON_SAVE_LOAD_HPP
#define FATHOM_COMMON_SAVE_LOAD_HPP
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../activation/apply.hpp"
#include "../annealing/annealing.hpp"
#include "../initialization/apply.hpp"
#include "../loss/loss.hpp"
#include "../optimizer/optimizer.hpp"
#include "error.hpp"
#include "options.hpp"

namespace Fathom::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            // Stream extraction wraps "-1" into a huge unsigned value instead of failing.
            if constexpr (std::is_unsigned_v<Numeric> && !std::is_same_v<Numeric, bool>) {
                const auto text = tree.get_optional<std::string>(key);
                if (text && text->find('-') != std::string::npos) {
                    throw ConfigurationError("Field '" + key + "' in " + context + " must be non-negative, got '"
                                             + *text + "'.");
                }
            }
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                throw ConfigurationError("Missing or invalid numeric field '" + key + "' in " + context);
            }
            return *value;
        }

        // Missing keys fall back to the defaults already held by the option structs.
        template <class Value>
        void read_optional(const PropertyTree& tree, const std::string& key, Value& target, const std::string& context)
        {
            if (!tree.get_child_optional(key)) {
                return;
            }
            if constexpr (std::is_same_v<Value, std::string>) {
                target = tree.get<std::string>(key);
            } else {
                target = get_numeric<Value>(tree, key, context);
            }
        }

        inline std::string estimator_to_string(Loss::Estimator estimator)
        {
            switch (estimator) {
                case Loss::Estimator::ImportanceWeighted: return "importance_weighted";
                case Loss::Estimator::SampleAverage:
                default: return "sample_average";
            }
        }

        inline Loss::Estimator estimator_from_string(const std::string& value, const std::string& context)
        {
            if (value == "sample_average") {
                return Loss::Estimator::SampleAverage;
            }
            if (value == "importance_weighted") {
                return Loss::Estimator::ImportanceWeighted;
            }
            throw ConfigurationError("Unknown estimator '" + value + "' in " + context);
        }

        inline PropertyTree serialize_optimizer(const Optimizer::Descriptor& descriptor)
        {
            PropertyTree tree;
            std::visit([&tree](const auto& concrete) {
                using DescriptorType = std::decay_t<decltype(concrete)>;
                const auto& options = concrete.options;
                tree.put("learning_rate", options.learning_rate);
                tree.put("weight_decay", options.weight_decay);
                if constexpr (std::is_same_v<DescriptorType, Optimizer::SGDDescriptor>) {
                    tree.put("type", "sgd");
                    tree.put("momentum", options.momentum);
                    tree.put("dampening", options.dampening);
                    tree.put("nesterov", options.nesterov);
                } else {
                    tree.put("type", std::is_same_v<DescriptorType, Optimizer::AdamDescriptor> ? "adam" : "adamw");
                    tree.put("beta1", options.beta1);
                    tree.put("beta2", options.beta2);
                    tree.put("eps", options.eps);
                    tree.put("amsgrad", options.amsgrad);
                }
            }, descriptor);
            return tree;
        }

        template <class Options>
        void read_moment_options(const PropertyTree& tree, Options& options, const std::string& context)
        {
            read_optional(tree, "learning_rate", options.learning_rate, context);
            read_optional(tree, "weight_decay", options.weight_decay, context);
            read_optional(tree, "beta1", options.beta1, context);
            read_optional(tree, "beta2", options.beta2, context);
            read_optional(tree, "eps", options.eps, context);
            read_optional(tree, "amsgrad", options.amsgrad, context);
        }

        inline Optimizer::Descriptor deserialize_optimizer(const PropertyTree& tree, const std::string& context)
        {
            const auto type = tree.get<std::string>("type", "adam");
            if (type == "adam") {
                Optimizer::AdamOptions options{};
                read_moment_options(tree, options, context);
                return Optimizer::Adam(options);
            }
            if (type == "adamw") {
                Optimizer::AdamWOptions options{};
                read_moment_options(tree, options, context);
                return Optimizer::AdamW(options);
            }
            if (type == "sgd") {
                Optimizer::SGDOptions options{};
                read_optional(tree, "learning_rate", options.learning_rate, context);
                read_optional(tree, "weight_decay", options.weight_decay, context);
                read_optional(tree, "momentum", options.momentum, context);
                read_optional(tree, "dampening", options.dampening, context);
                read_optional(tree, "nesterov", options.nesterov, context);
                return Optimizer::SGD(options);
            }
            throw ConfigurationError("Unknown optimizer type '" + type + "' in " + context);
        }

        inline PropertyTree serialize_annealing(const Annealing::Descriptor& descriptor)
        {
            PropertyTree tree;
            if (const auto* cyclic = std::get_if<Annealing::CyclicDescriptor>(&descriptor)) {
                tree.put("type", "cyclic");
                tree.put("beta_0", cyclic->options.beta_0);
                tree.put("init_beta_epochs", cyclic->options.init_beta_epochs);
                tree.put("burnin_beta", cyclic->options.burnin_beta);
                tree.put("beta_min", cyclic->options.beta_min);
                tree.put("beta_max", cyclic->options.beta_max);
                tree.put("period", cyclic->options.period);
            } else if (const auto* constant = std::get_if<Annealing::ConstantDescriptor>(&descriptor)) {
                tree.put("type", "constant");
                tree.put("beta", constant->options.beta);
            }
            return tree;
        }

        inline Annealing::Descriptor deserialize_annealing(const PropertyTree& tree, const std::string& context)
        {
            const auto type = tree.get<std::string>("type", "cyclic");
            if (type == "cyclic") {
                Annealing::CyclicOptions options{};
                read_optional(tree, "beta_0", options.beta_0, context);
                read_optional(tree, "init_beta_epochs", options.init_beta_epochs, context);
                read_optional(tree, "burnin_beta", options.burnin_beta, context);
                read_optional(tree, "beta_min", options.beta_min, context);
                read_optional(tree, "beta_max", options.beta_max, context);
                read_optional(tree, "period", options.period, context);
                return Annealing::Cyclic(options);
            }
            if (type == "constant") {
                return Annealing::Constant(get_numeric<double>(tree, "beta", context));
            }
            throw ConfigurationError("Unknown beta schedule '" + type + "' in " + context);
        }
    }

    inline PropertyTree serialize_model_options(const ModelOptions& options)
    {
        PropertyTree tree;
        tree.put("n_conditioning", options.n_conditioning);
        tree.put("input_dims", options.input_dims);
        tree.put("n_latent", options.n_latent);
        tree.put("layer_width", options.layer_width);
        tree.put("n_layers_enc", options.n_layers_enc);
        tree.put("n_layers_dec", options.n_layers_dec);
        tree.put("activation", Activation::Details::to_string(options.activation.type));
        tree.put("n_iwae", options.n_iwae);
        tree.put("enc_use_cond", options.enc_use_cond);
        tree.put("dropout", options.dropout);
        tree.put("initialization", Initialization::Details::to_string(options.initialization.type));
        tree.put("initialization_gain", options.initialization.gain);
        return tree;
    }

    inline ModelOptions deserialize_model_options(const PropertyTree& tree, const std::string& context)
    {
        ModelOptions options{};
        options.n_conditioning = Detail::get_numeric<int64_t>(tree, "n_conditioning", context);
        options.input_dims = Detail::get_numeric<int64_t>(tree, "input_dims", context);
        options.n_latent = Detail::get_numeric<int64_t>(tree, "n_latent", context);
        Detail::read_optional(tree, "layer_width", options.layer_width, context);
        Detail::read_optional(tree, "n_layers_enc", options.n_layers_enc, context);
        Detail::read_optional(tree, "n_layers_dec", options.n_layers_dec, context);
        Detail::read_optional(tree, "n_iwae", options.n_iwae, context);
        Detail::read_optional(tree, "enc_use_cond", options.enc_use_cond, context);
        Detail::read_optional(tree, "dropout", options.dropout, context);
        if (const auto activation = tree.get_optional<std::string>("activation")) {
            options.activation = Activation::Details::from_string(*activation);
        }
        if (const auto initialization = tree.get_optional<std::string>("initialization")) {
            options.initialization = Initialization::Details::from_string(*initialization);
        }
        Detail::read_optional(tree, "initialization_gain", options.initialization.gain, context);
        validate(options);
        return options;
    }

    // Serialisable part of TrainOptions; the held-out tensors and stream stay in code.
    inline PropertyTree serialize_train_options(const TrainOptions& options)
    {
        PropertyTree tree;
        tree.put("epochs", options.epochs);
        tree.put("test_every", options.test_every);
        tree.put("log_every", options.log_every);
        if (options.seed) {
            tree.put("seed", *options.seed);
        }
        tree.put("halt_on_instability", options.halt_on_instability);
        tree.put("monitor", options.monitor);
        tree.put("estimator", Detail::estimator_to_string(options.objective.options.estimator));
        tree.add_child("optimizer", Detail::serialize_optimizer(options.optimizer));
        tree.add_child("beta", Detail::serialize_annealing(options.beta));
        return tree;
    }

    inline TrainOptions deserialize_train_options(const PropertyTree& tree, const std::string& context)
    {
        TrainOptions options{};
        Detail::read_optional(tree, "epochs", options.epochs, context);
        Detail::read_optional(tree, "test_every", options.test_every, context);
        Detail::read_optional(tree, "log_every", options.log_every, context);
        if (tree.get_child_optional("seed")) {
            options.seed = Detail::get_numeric<std::uint64_t>(tree, "seed", context);
        }
        Detail::read_optional(tree, "halt_on_instability", options.halt_on_instability, context);
        Detail::read_optional(tree, "monitor", options.monitor, context);
        if (const auto estimator = tree.get_optional<std::string>("estimator")) {
            options.objective.options.estimator = Detail::estimator_from_string(*estimator, context);
        }
        if (const auto optimizer = tree.get_child_optional("optimizer")) {
            options.optimizer = Detail::deserialize_optimizer(*optimizer, context + ".optimizer");
        }
        if (const auto beta = tree.get_child_optional("beta")) {
            options.beta = Detail::deserialize_annealing(*beta, context + ".beta");
        }
        validate(options);
        return options;
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to parse '" + path.string() + "': " + error.what());
        }
        return tree;
    }

    struct Config {
        ModelOptions model{};
        TrainOptions train{};
    };

    // {"model": {...}, "train": {...}}; "train" may be omitted.
    inline Config read_config(const std::filesystem::path& path)
    {
        const auto tree = read_json_file(path);
        const auto context = path.string();
        const auto model = tree.get_child_optional("model");
        if (!model) {
            throw ConfigurationError("Configuration '" + context + "' has no \"model\" section.");
        }
        Config config{};
        config.model = deserialize_model_options(*model, context + ":model");
        if (const auto train = tree.get_child_optional("train")) {
            config.train = deserialize_train_options(*train, context + ":train");
        }
        return config;
    }

    inline void write_config(const std::filesystem::path& path, const ModelOptions& model, const TrainOptions& train)
    {
        PropertyTree tree;
        tree.add_child("model", serialize_model_options(model));
        tree.add_child("train", serialize_train_options(train));
        write_json_file(path, tree);
    }

    inline ModelOptions read_architecture(const std::filesystem::path& directory)
    {
        const auto path = directory / "architecture.json";
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Architecture file not found at '" + path.string() + "'.");
        }
        const auto tree = read_json_file(path);
        const auto model = tree.get_child_optional("model");
        if (!model) {
            throw ConfigurationError("Architecture description '" + path.string() + "' has no \"model\" section.");
        }
        return deserialize_model_options(*model, path.string());
    }
}
#endif // FATHOM_COMMON_SAVE_LOAD_HPP
