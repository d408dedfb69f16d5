#ifndef FATHOM_CORE_HPP
#define FATHOM_CORE_HPP
/*
 * Conditional importance-weighted VAE.
 * ---------------------------------------------------------------------------
 *  - Model owns the encoder q(z | x, w), the decoder p(x | z, w) and a fixed
 *    N(0, I) prior over the latent space. forward() draws n_iwae latents per
 *    example and returns the reconstructions together with the analytic KL.
 *  - train() runs full-batch epochs: one objective evaluation, one backward
 *    pass and one optimizer step per epoch, with the KL weight taken from the
 *    annealing schedule. The held-out split is scored every `test_every`
 *    epochs without gradients.
 *  - Generative use goes through decode()/sample_prior() with externally
 *    supplied latents or prior draws.
 */

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "activation/activation.hpp"
#include "annealing/annealing.hpp"
#include "common/error.hpp"
#include "common/options.hpp"
#include "common/save_load.hpp"
#include "loss/loss.hpp"
#include "network/network.hpp"
#include "optimizer/optimizer.hpp"
#include "utils/terminal.hpp"

namespace Fathom {
    struct ForwardResult {
        torch::Tensor reconstruction;  // (K, batch, input_dims)
        torch::Tensor latents;         // (K, batch, n_latent)
        torch::Tensor kl;              // (batch)
        Network::DiagonalGaussian posterior;
    };

    struct LossRecord {
        std::size_t epoch{};
        double beta{};
        double total{};
        double reconstruction{};
        double kl{};
    };

    struct TrainingHistory {
        std::vector<LossRecord> train{};
        std::vector<LossRecord> test{};
        std::vector<std::string> warnings{};

        void clear() noexcept
        {
            train.clear();
            test.clear();
            warnings.clear();
        }
    };

    enum class TrainingPhase {
        Initializing,
        EpochTraining,
        PeriodicEvaluation,
        Stopped,
    };

    class Model : public torch::nn::Module {
    public:
        explicit Model(ModelOptions options, std::string name = "fathom")
            : options_(std::move(options)), name_(std::move(name))
        {
            validate(options_);

            encoder_ = register_module("encoder", Network::Encoder(Network::EncoderOptions{
                .input_dims = options_.input_dims,
                .n_conditioning = options_.n_conditioning,
                .n_latent = options_.n_latent,
                .width = options_.layer_width,
                .layers = options_.n_layers_enc,
                .activation = options_.activation,
                .dropout = options_.dropout,
                .use_conditioning = options_.enc_use_cond,
                .initialization = options_.initialization}));

            decoder_ = register_module("decoder", Network::Decoder(Network::DecoderOptions{
                .n_latent = options_.n_latent,
                .n_conditioning = options_.n_conditioning,
                .output_dims = options_.input_dims,
                .width = options_.layer_width,
                .layers = options_.n_layers_dec,
                .activation = options_.activation,
                .dropout = options_.dropout,
                .initialization = options_.initialization}));

            auto prior = Network::standard_normal(options_.n_latent);
            prior_mean_ = register_buffer("prior_mean", prior.mean);
            prior_std_ = register_buffer("prior_std", prior.std);
        }

        [[nodiscard]] const ModelOptions& options() const noexcept { return options_; }
        [[nodiscard]] const std::string& model_name() const noexcept { return name_; }
        [[nodiscard]] const TrainingHistory& history() const noexcept { return history_; }
        [[nodiscard]] TrainingPhase training_phase() const noexcept { return phase_; }
        [[nodiscard]] const torch::Device& device() const noexcept { return device_; }

        [[nodiscard]] Network::DiagonalGaussian prior() const { return Network::DiagonalGaussian{prior_mean_, prior_std_}; }

        void train(bool on = true) override { torch::nn::Module::train(on); }

        Model& to_device(bool use_cuda = true)
        {
            if (use_cuda) {
                if (!torch::cuda::is_available()) {
                    throw std::runtime_error("CUDA device requested but is unavailable.");
                }
                device_ = torch::Device(torch::kCUDA, /*index=*/0);
            } else {
                device_ = torch::Device(torch::kCPU);
            }
            this->to(device_);
            return *this;
        }

        [[nodiscard]] Network::DiagonalGaussian encode(const torch::Tensor& targets, const torch::Tensor& conditioning)
        {
            check_pair(targets, conditioning);
            return encoder_->forward(stage(targets), stage(conditioning));
        }

        // latents (K, batch, n_latent) supplied by the caller, e.g. prior draws.
        [[nodiscard]] torch::Tensor decode(const torch::Tensor& latents, const torch::Tensor& conditioning)
        {
            if (!latents.defined() || latents.dim() != 3 || latents.size(2) != options_.n_latent) {
                throw ShapeMismatchError("decode expects latents shaped (K, batch, " + std::to_string(options_.n_latent)
                                         + "), got " + Common::Details::describe_shape(latents) + ".");
            }
            Common::Details::expect_matrix(conditioning, options_.n_conditioning, "conditioning");
            Common::Details::expect_same_batch(latents, "latents", conditioning, "conditioning", /*lhs_axis=*/1);
            return decoder_->forward(stage(latents), stage(conditioning));
        }

        [[nodiscard]] ForwardResult forward(const torch::Tensor& targets, const torch::Tensor& conditioning)
        {
            auto posterior = encode(targets, conditioning);
            auto latents = posterior.rsample(options_.n_iwae);
            auto reconstruction = decoder_->forward(latents, stage(conditioning));
            auto kl = Loss::Details::analytic_kl(posterior, prior());
            return ForwardResult{std::move(reconstruction), std::move(latents), std::move(kl), std::move(posterior)};
        }

        // Decodes `samples` prior draws per conditioning row -> (samples, batch, input_dims).
        [[nodiscard]] torch::Tensor sample_prior(const torch::Tensor& conditioning, int64_t samples)
        {
            if (samples <= 0) {
                throw ConfigurationError("sample_prior requires at least one sample.");
            }
            Common::Details::expect_matrix(conditioning, options_.n_conditioning, "conditioning");
            InferenceScope scope(*this);
            auto latents = prior().rsample(samples, conditioning.size(0));
            return decoder_->forward(latents, stage(conditioning));
        }

        // Posterior-predictive draws for observed pairs -> (n_iwae, batch, input_dims).
        [[nodiscard]] torch::Tensor reconstruct(const torch::Tensor& targets, const torch::Tensor& conditioning)
        {
            InferenceScope scope(*this);
            return forward(targets, conditioning).reconstruction;
        }

        // Objective on a split without gradients and with dropout disabled.
        [[nodiscard]] Loss::ObjectiveResult evaluate(const torch::Tensor& targets,
                                                     const torch::Tensor& conditioning,
                                                     double beta,
                                                     const Loss::ObjectiveDescriptor& objective = Loss::ELBO())
        {
            InferenceScope scope(*this);
            return Loss::compute(objective, *this, targets, conditioning, beta);
        }

        void train(const torch::Tensor& train_targets, const torch::Tensor& train_conditioning, TrainOptions options = {})
        {
            phase_ = TrainingPhase::Initializing;
            validate(options);
            check_pair(train_targets, train_conditioning);
            if (train_targets.size(0) == 0) {
                throw ShapeMismatchError("Cannot train on an empty split.");
            }

            std::optional<HeldOut> test{};
            if (options.test) {
                check_pair(options.test->targets, options.test->conditioning);
                if (options.test->targets.size(0) > 0) {
                    test = HeldOut{stage(options.test->targets), stage(options.test->conditioning)};
                }
            }

            if (options.seed) {
                torch::manual_seed(*options.seed);
            }

            history_.clear();
            auto optimizer = Optimizer::Details::build_optimizer(this->parameters(), options.optimizer);
            auto objective = options.objective;
            objective.options.reduction = Loss::Reduction::None;

            const auto targets = stage(train_targets);
            const auto conditioning = stage(train_conditioning);
            std::ostream* const stream = options.monitor ? options.stream : nullptr;

            for (std::size_t epoch = 0; epoch < options.epochs; ++epoch) {
                phase_ = TrainingPhase::EpochTraining;
                const auto start = std::chrono::steady_clock::now();
                const double beta = Annealing::value(options.beta, epoch);

                this->train(true);
                optimizer->zero_grad();
                auto result = Loss::compute(objective, *this, targets, conditioning, beta);
                auto loss = result.total.mean();

                LossRecord record{epoch, beta, loss.item<double>(),
                                  result.reconstruction.mean().item<double>(),
                                  result.kl.mean().item<double>()};

                if (!std::isfinite(record.total)) {
                    std::ostringstream message;
                    message << "Non-finite training loss at epoch " << epoch << " (reconstruction "
                            << record.reconstruction << ", KL " << record.kl << ", beta " << beta << ").";
                    if (options.halt_on_instability) {
                        phase_ = TrainingPhase::Stopped;
                        throw NumericalInstabilityError(message.str());
                    }
                    report_instability(stream, message.str());
                }
                check_posterior_floor(result.posterior, epoch, stream);

                loss.backward();
                optimizer->step();
                history_.train.push_back(record);

                std::optional<LossRecord> test_record{};
                const bool last_epoch = epoch + 1 == options.epochs;
                if (test && (epoch % options.test_every == 0 || last_epoch)) {
                    phase_ = TrainingPhase::PeriodicEvaluation;
                    auto scored = evaluate(test->targets, test->conditioning, beta, objective);
                    test_record = LossRecord{epoch, beta, scored.total.mean().item<double>(),
                                             scored.reconstruction.mean().item<double>(),
                                             scored.kl.mean().item<double>()};
                    history_.test.push_back(*test_record);
                }

                if (stream != nullptr && ((epoch + 1) % options.log_every == 0 || last_epoch)) {
                    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
                    log_epoch(*stream, epoch + 1, options.epochs, record, test_record, elapsed.count());
                }
            }

            this->train(false);
            phase_ = TrainingPhase::Stopped;
        }

        void save(const std::filesystem::path& directory) const
        {
            namespace fs = std::filesystem;
            if (directory.empty()) {
                throw std::invalid_argument("Model::save requires a non-empty directory path.");
            }
            fs::create_directories(directory);

            const auto architecture_path = directory / "architecture.json";
            const auto parameters_path = directory / "parameters.binary";

            Common::SaveLoad::PropertyTree architecture;
            architecture.put("name", name_);
            architecture.add_child("model", Common::SaveLoad::serialize_model_options(options_));
            Common::SaveLoad::write_json_file(architecture_path, architecture);

            torch::serialize::OutputArchive archive;
            torch::nn::Module::save(archive);
            archive.save_to(parameters_path.string());
        }

        // Loads parameters written by save(); the stored architecture must match this model.
        void load(const std::filesystem::path& directory)
        {
            namespace fs = std::filesystem;
            if (directory.empty()) {
                throw std::invalid_argument("Model::load requires a non-empty directory path.");
            }

            const auto stored = Common::SaveLoad::read_architecture(directory);
            if (Common::SaveLoad::serialize_model_options(stored) != Common::SaveLoad::serialize_model_options(options_)) {
                throw ConfigurationError("Architecture stored in '" + directory.string()
                                         + "' does not match the options of this model.");
            }

            const auto parameters_path = directory / "parameters.binary";
            if (!fs::exists(parameters_path)) {
                throw std::runtime_error("Parameter archive not found at '" + parameters_path.string() + "'.");
            }

            try {
                torch::serialize::InputArchive archive;
                archive.load_from(parameters_path.string(), device_);
                torch::nn::Module::load(archive);
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to load parameters from '" + parameters_path.string() + "': " + error.what());
            }
        }

    private:
        // Eval mode and no autograd for the lifetime of the scope; restores the previous mode.
        class InferenceScope {
        public:
            explicit InferenceScope(Model& model) : model_(model), was_training_(model.is_training()) { model_.train(false); }
            ~InferenceScope() { model_.train(was_training_); }
            InferenceScope(const InferenceScope&) = delete;
            InferenceScope& operator=(const InferenceScope&) = delete;

        private:
            Model& model_;
            bool was_training_;
            torch::NoGradGuard no_grad_{};
        };

        void check_pair(const torch::Tensor& targets, const torch::Tensor& conditioning) const
        {
            Common::Details::expect_matrix(targets, options_.input_dims, "targets");
            Common::Details::expect_matrix(conditioning, options_.n_conditioning, "conditioning");
            Common::Details::expect_same_batch(targets, "targets", conditioning, "conditioning");
        }

        [[nodiscard]] torch::Tensor stage(const torch::Tensor& tensor) const
        {
            if (tensor.device() == device_ && tensor.scalar_type() == torch::kFloat32) {
                return tensor;
            }
            return tensor.to(device_, torch::kFloat32);
        }

        void report_instability(std::ostream* stream, const std::string& message)
        {
            history_.warnings.push_back(message);
            if (stream != nullptr) {
                *stream << Utils::Terminal::ApplyColor("Warning", Utils::Terminal::Colors::kRed) << ": " << message << '\n';
            }
        }

        void check_posterior_floor(const Network::DiagonalGaussian& posterior, std::size_t epoch, std::ostream* stream)
        {
            constexpr double kCollapseMargin = 1e-4;
            const auto headroom = (posterior.std.detach() - Network::kStdFloor).min().item<double>();
            if (headroom < kCollapseMargin) {
                std::ostringstream message;
                message << "Posterior std reached its floor at epoch " << epoch << " (min std "
                        << std::scientific << headroom + Network::kStdFloor << ").";
                report_instability(stream, message.str());
            }
        }

        static void log_epoch(std::ostream& stream,
                              std::size_t epoch_index,
                              std::size_t total_epochs,
                              const LossRecord& train,
                              const std::optional<LossRecord>& test,
                              double duration_seconds)
        {
            using Utils::Terminal::ApplyColor;
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightBlue;
            using Utils::Terminal::Colors::kBrightMagenta;
            using Utils::Terminal::Colors::kBrightYellow;

            std::ostringstream line;
            line << std::fixed << std::setprecision(6);
            line << "Epoch [" << epoch_index << "/" << total_epochs << "] | ";
            line << ApplyColor("Train", kBrightYellow) << " loss: " << train.total
                 << " (rec " << train.reconstruction << ", KL " << train.kl << ") | ";
            line << ApplyColor("Test", kBrightBlue) << " loss: ";
            if (test) {
                line << test->total << " (rec " << test->reconstruction << ", KL " << test->kl << ")";
            } else {
                line << "N/A";
            }
            line << " | " << ApplyColor("β", kBrightMagenta) << ": " << std::setprecision(4) << train.beta;

            std::ostringstream duration_stream;
            duration_stream << std::fixed << std::setprecision(2) << duration_seconds << "sec";
            line << " | " << ApplyColor("duration: " + duration_stream.str(), kBrightBlack);

            stream << line.str() << '\n';
        }

        ModelOptions options_{};
        std::string name_{};
        Network::Encoder encoder_{nullptr};
        Network::Decoder decoder_{nullptr};
        torch::Tensor prior_mean_{};
        torch::Tensor prior_std_{};
        torch::Device device_{torch::kCPU};
        TrainingHistory history_{};
        TrainingPhase phase_{TrainingPhase::Initializing};
    };
}

#endif // FATHOM_CORE_HPP
