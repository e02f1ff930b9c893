// VBIN Variational Autoencoder
// Architecture: [depths | TNF] -> ([Linear -> LeakyReLU -> BN -> Dropout] x hidden)
//               -> mu, logsigma -> z -> mirrored decoder -> [depths | TNF]
#pragma once

#include "../pipeline/types.h"

#include <torch/torch.h>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace vbin {

class Logger;

// True when LibTorch can see a CUDA device
bool accelerator_available();

namespace encoder {

struct VaeConfig {
    std::vector<int> hidden_layers{325, 325, 325};
    int latent_dim = 40;
    int epochs = 400;
    int batch_size = 128;
    double capacity = 1000.0;   // higher = weaker KL penalty
    double mse_ratio = 0.2;     // weight of TNF reconstruction vs depth
    bool use_cuda = false;
    float learning_rate = 1e-3f;
    float dropout = 0.2f;
    uint64_t seed = 0;
};

struct VAEImpl : torch::nn::Module {
    torch::nn::Sequential encoder{nullptr};
    torch::nn::Sequential decoder{nullptr};
    torch::nn::Linear mu_head{nullptr};
    torch::nn::Linear logsigma_head{nullptr};
    torch::nn::Linear output{nullptr};
    int n_samples_;
    int n_tnf_;
    int latent_dim_;

    VAEImpl(int n_samples, int n_tnf, const std::vector<int>& hidden_layers,
            int latent_dim, float dropout);

    // Returns (mu, logsigma)
    std::tuple<torch::Tensor, torch::Tensor> encode(const torch::Tensor& depths,
                                                    const torch::Tensor& tnf);

    // Returns (depth reconstruction, TNF reconstruction). Depths come out as
    // log-probabilities when there is more than one sample.
    std::tuple<torch::Tensor, torch::Tensor> decode(const torch::Tensor& z);

    // Returns (depths_out, tnf_out, mu, logsigma)
    std::tuple<torch::Tensor, torch::Tensor, torch::Tensor, torch::Tensor>
    forward(const torch::Tensor& depths, const torch::Tensor& tnf);
};
TORCH_MODULE(VAE);

struct VaeLoss {
    torch::Tensor total;
    torch::Tensor depth;
    torch::Tensor tnf;
    torch::Tensor kld;
};

VaeLoss vae_loss(const torch::Tensor& depths, const torch::Tensor& tnf,
                 const torch::Tensor& depths_out, const torch::Tensor& tnf_out,
                 const torch::Tensor& mu, const torch::Tensor& logsigma,
                 int n_samples, double mse_ratio, double capacity);

// Row-normalised depths (z-scored for a single sample) and z-scored TNF
std::tuple<torch::Tensor, torch::Tensor> normalize_inputs(const Matrix& rpkm,
                                                          const Matrix& tnf);

// Trains the VAE on row-aligned rpkm/tnf, saves it to model_path and returns
// the latent means of all rows
Matrix train_vae(const Matrix& rpkm, const Matrix& tnf, const VaeConfig& config,
                 const std::string& model_path, Logger* log = nullptr);

}  // namespace encoder
}  // namespace vbin
