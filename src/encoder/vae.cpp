// VBIN Variational Autoencoder - training and encoding

#include "vae.h"
#include "../util/logger.h"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace vbin {

bool accelerator_available() {
    return torch::cuda::is_available();
}

namespace encoder {

namespace {

void append_block(torch::nn::Sequential& seq, int in_sz, int out_sz, float dropout) {
    seq->push_back(torch::nn::Linear(in_sz, out_sz));
    seq->push_back(torch::nn::LeakyReLU(torch::nn::LeakyReLUOptions().negative_slope(0.01)));
    seq->push_back(torch::nn::BatchNorm1d(out_sz));
    if (dropout > 0) {
        seq->push_back(torch::nn::Dropout(dropout));
    }
}

torch::Tensor to_tensor(const Matrix& m) {
    return torch::from_blob(const_cast<float*>(m.data()), {m.rows(), m.cols()},
                            torch::kFloat32).clone();
}

// Population z-score per column; constant columns become zero
torch::Tensor zscore_columns(const torch::Tensor& x) {
    auto centered = x - x.mean(0, true);
    auto sd = centered.pow(2).mean(0, true).sqrt();
    return centered / torch::where(sd > 0, sd, torch::ones_like(sd));
}

}  // namespace

VAEImpl::VAEImpl(int n_samples, int n_tnf, const std::vector<int>& hidden_layers,
                 int latent_dim, float dropout)
    : n_samples_(n_samples), n_tnf_(n_tnf), latent_dim_(latent_dim) {
    const int in_sz = n_samples + n_tnf;

    encoder = register_module("encoder", torch::nn::Sequential());
    int prev = in_sz;
    for (int width : hidden_layers) {
        append_block(encoder, prev, width, dropout);
        prev = width;
    }
    mu_head = register_module("mu", torch::nn::Linear(prev, latent_dim));
    logsigma_head = register_module("logsigma", torch::nn::Linear(prev, latent_dim));

    decoder = register_module("decoder", torch::nn::Sequential());
    prev = latent_dim;
    for (auto it = hidden_layers.rbegin(); it != hidden_layers.rend(); ++it) {
        append_block(decoder, prev, *it, dropout);
        prev = *it;
    }
    output = register_module("output", torch::nn::Linear(prev, in_sz));
}

std::tuple<torch::Tensor, torch::Tensor> VAEImpl::encode(const torch::Tensor& depths,
                                                         const torch::Tensor& tnf) {
    auto h = encoder->forward(torch::cat({depths, tnf}, 1));
    return {mu_head->forward(h), logsigma_head->forward(h)};
}

std::tuple<torch::Tensor, torch::Tensor> VAEImpl::decode(const torch::Tensor& z) {
    auto out = output->forward(decoder->forward(z));
    auto depths_out = out.narrow(1, 0, n_samples_);
    auto tnf_out = out.narrow(1, n_samples_, n_tnf_);
    if (n_samples_ > 1) {
        depths_out = torch::log_softmax(depths_out, 1);
    }
    return {depths_out, tnf_out};
}

std::tuple<torch::Tensor, torch::Tensor, torch::Tensor, torch::Tensor>
VAEImpl::forward(const torch::Tensor& depths, const torch::Tensor& tnf) {
    auto [mu, logsigma] = encode(depths, tnf);
    torch::Tensor z = mu;
    if (is_training()) {
        z = mu + torch::randn_like(mu) * torch::exp(0.5 * logsigma);
    }
    auto [depths_out, tnf_out] = decode(z);
    return {depths_out, tnf_out, mu, logsigma};
}

VaeLoss vae_loss(const torch::Tensor& depths, const torch::Tensor& tnf,
                 const torch::Tensor& depths_out, const torch::Tensor& tnf_out,
                 const torch::Tensor& mu, const torch::Tensor& logsigma,
                 int n_samples, double mse_ratio, double capacity) {
    VaeLoss loss;
    if (n_samples > 1) {
        // Cross-entropy of the sample distribution
        loss.depth = -(depths_out * depths).sum(1).mean();
    } else {
        loss.depth = (depths_out - depths).pow(2).sum(1).mean();
    }
    loss.tnf = (tnf_out - tnf).pow(2).mean(1).mean();
    loss.kld = (-0.5 * (1 + logsigma - mu.pow(2) - logsigma.exp()).sum(1)).mean();

    const double kld_weight = 1.0 / (1.0 + capacity);
    loss.total = (1.0 - mse_ratio) * loss.depth + mse_ratio * loss.tnf + kld_weight * loss.kld;
    return loss;
}

std::tuple<torch::Tensor, torch::Tensor> normalize_inputs(const Matrix& rpkm,
                                                          const Matrix& tnf) {
    auto depths = to_tensor(rpkm);
    if (depths.size(1) > 1) {
        depths = depths / depths.sum(1, true).clamp_min(1e-9);
    } else {
        depths = zscore_columns(depths);
    }

    return {depths, zscore_columns(to_tensor(tnf))};
}

Matrix train_vae(const Matrix& rpkm, const Matrix& tnf, const VaeConfig& config,
                 const std::string& model_path, Logger* log) {
    if (rpkm.rows() != tnf.rows()) {
        throw std::invalid_argument("Depth rows (" + std::to_string(rpkm.rows()) +
                                    ") and TNF rows (" + std::to_string(tnf.rows()) +
                                    ") differ");
    }
    const int64_t n = rpkm.rows();
    // BatchNorm needs two rows per batch in training mode
    if (n < 2) {
        throw std::runtime_error("At least 2 contigs are needed to train the autoencoder, got " +
                                 std::to_string(n));
    }
    if (config.use_cuda && !accelerator_available()) {
        throw std::runtime_error("CUDA requested but not available");
    }

    torch::manual_seed(config.seed);
    torch::Device device = config.use_cuda ? torch::kCUDA : torch::kCPU;

    auto [depths, tnf_z] = normalize_inputs(rpkm, tnf);
    depths = depths.to(device);
    tnf_z = tnf_z.to(device);

    const int n_samples = static_cast<int>(rpkm.cols());
    const int n_tnf = static_cast<int>(tnf.cols());
    VAE model(n_samples, n_tnf, config.hidden_layers, config.latent_dim, config.dropout);
    model->to(device);

    torch::optim::Adam optimizer(model->parameters(),
                                 torch::optim::AdamOptions(config.learning_rate));

    const int64_t batch_size = std::max<int64_t>(2, std::min<int64_t>(config.batch_size, n));
    if (log) {
        log->info("Training VAE: " + std::to_string(n) + " contigs, " +
                  std::to_string(n_samples) + " samples, " + std::to_string(config.epochs) +
                  " epochs, batch size " + std::to_string(batch_size) +
                  (config.use_cuda ? ", CUDA" : ", CPU"));
    }

    model->train();
    for (int epoch = 1; epoch <= config.epochs; ++epoch) {
        auto perm = torch::randperm(n, torch::TensorOptions().dtype(torch::kLong).device(device));
        double epoch_loss = 0.0, epoch_depth = 0.0, epoch_tnf = 0.0, epoch_kld = 0.0;
        int n_batches = 0;

        for (int64_t start = 0; start < n; start += batch_size) {
            int64_t end = std::min(start + batch_size, n);
            if (end - start < 2) continue;

            auto idx = perm.slice(0, start, end);
            auto d = depths.index_select(0, idx);
            auto t = tnf_z.index_select(0, idx);

            optimizer.zero_grad();
            auto [d_out, t_out, mu, logsigma] = model->forward(d, t);
            VaeLoss loss = vae_loss(d, t, d_out, t_out, mu, logsigma, n_samples,
                                    config.mse_ratio, config.capacity);
            loss.total.backward();
            optimizer.step();

            epoch_loss += loss.total.item<double>();
            epoch_depth += loss.depth.item<double>();
            epoch_tnf += loss.tnf.item<double>();
            epoch_kld += loss.kld.item<double>();
            n_batches++;
        }

        if (log && n_batches > 0) {
            std::ostringstream ss;
            ss << "Epoch " << epoch << "/" << config.epochs << "  loss " << epoch_loss / n_batches
               << "  depth " << epoch_depth / n_batches << "  tnf " << epoch_tnf / n_batches
               << "  kld " << epoch_kld / n_batches;
            log->detail(ss.str());
            log->progress("Training", epoch, config.epochs);
        }
    }

    torch::save(model, model_path);

    // Encode every contig with the latent means
    model->eval();
    torch::NoGradGuard no_grad;
    std::vector<torch::Tensor> chunks;
    for (int64_t start = 0; start < n; start += batch_size) {
        int64_t len = std::min(batch_size, n - start);
        auto encoded = model->encode(depths.narrow(0, start, len), tnf_z.narrow(0, start, len));
        chunks.push_back(std::get<0>(encoded).to(torch::kCPU));
    }
    auto latent = torch::cat(chunks, 0).contiguous();

    Matrix out(n, config.latent_dim);
    std::memcpy(out.data(), latent.data_ptr<float>(), sizeof(float) * n * config.latent_dim);
    return out;
}

}  // namespace encoder
}  // namespace vbin
