//
// apply-mask-beamformer.cc
// wujian@2018
//

#include "util/common-utils.h"
#include "util/kaldi-thread.h"
#include "include/beamformer.h"
#include "include/mask-beamformer.h"

using namespace kaldi;

int main(int argc, char *argv[]) {
    try{
        const char *usage =
            "Do mask based beamforming (GEV, PCA or PCA-MVDR) on multi-channel STFT in realfft format\n"
            "\n"
            "Usage: apply-mask-beamformer [options...] <mask-rspecifier> <ch1-stft-rspecifier> ... <enhan-stft-wspecifier>\n"
            "e.g.:\n"
            " apply-mask-beamformer --beamformer=gev --normalize=true scp:mask.scp \\\n"
            "   scp:ch1.scp scp:ch2.scp ark:enhan.ark\n";

        ParseOptions po(usage);
        bftk::MaskBeamformerOptions beamformer_opts;
        std::string mask_type = "target";

        beamformer_opts.Register(&po);
        po.Register("mask-type", &mask_type, "Type of the input mask(\"target\"|\"noise\")");
        po.Register("num-threads", &g_num_threads, "Number of threads used in batched solvers");

        po.Read(argc, argv);

        int32 num_args = po.NumArgs();

        if (num_args <= 3) {
            po.PrintUsage();
            exit(1);
        }
        if (mask_type != "target" && mask_type != "noise")
            KALDI_ERR << "Unknown mask type: " << mask_type;

        std::string mask_rspecifier = po.GetArg(1), enhan_wspecifier = po.GetArg(num_args);
        int32 num_channels = num_args - 2;

        std::vector<RandomAccessBaseFloatMatrixReader> stft_reader(num_channels);
        for (int32 i = 2; i < num_args; i++) {
            std::string cur_ch = po.GetArg(i);
            if (ClassifyRspecifier(cur_ch, NULL, NULL) == kNoRspecifier)
                KALDI_ERR << cur_ch << " is not a rspecifier";
            if (!stft_reader[i - 2].Open(cur_ch))
                KALDI_ERR << "Failed to open " << cur_ch;
        }

        SequentialBaseFloatMatrixReader mask_reader(mask_rspecifier);
        BaseFloatMatrixWriter stft_writer(enhan_wspecifier);

        int32 num_done = 0, num_miss = 0, num_utts = 0;

        for (; !mask_reader.Done(); mask_reader.Next()) {
            std::string utt_key = mask_reader.Key();
            const Matrix<BaseFloat> &mask = mask_reader.Value();
            num_utts++;

            // rstft: realfft of each channel, (num_frames, fft_len)
            std::vector<Matrix<double> > rstft;
            for (int32 c = 0; c < num_channels; c++) {
                if (stft_reader[c].HasKey(utt_key))
                    rstft.push_back(Matrix<double>(stft_reader[c].Value(utt_key)));
            }
            int32 cur_ch = rstft.size();
            KALDI_VLOG(2) << "Processing " << cur_ch << " channels for " << utt_key;
            if (cur_ch <= 1) {
                KALDI_WARN << "Utterance " << utt_key << ": only " << cur_ch
                           << " channel(s) available, skip";
                num_miss++;
                continue;
            }

            int32 num_frames = rstft[0].NumRows(), num_bins = rstft[0].NumCols() / 2 + 1;
            bool problem = (num_frames == 0);
            if (problem)
                KALDI_WARN << "Utterance " << utt_key << " has no frames, skip";
            for (int32 c = 0; c < cur_ch; c++) {
                if (rstft[c].NumCols() != (num_bins - 1) * 2 || rstft[c].NumRows() != num_frames) {
                    KALDI_WARN << "There is obvious length difference between "
                               << "multiple channels, please check, skip for " << utt_key;
                    problem = true;
                    break;
                }
            }
            if (problem) {
                num_miss++;
                continue;
            }
            if (mask.NumRows() != num_frames || mask.NumCols() != num_bins) {
                KALDI_WARN << "Utterance " << utt_key << ": The shape of mask is different from stft"
                           << " (" << mask.NumRows() << " x " << mask.NumCols() << ") vs"
                           << " (" << num_frames << " x " << num_bins << ")";
                num_miss++;
                continue;
            }

            // mix: (num_frames, num_channels, num_bins)
            bftk::CTensor<double> mix(bftk::TensorDims{num_frames, cur_ch, num_bins});
            bftk::CMatrix<double> cstft(num_frames, num_bins);
            for (int32 c = 0; c < cur_ch; c++) {
                cstft.CopyFromRealfft(rstft[c]);
                for (int32 t = 0; t < num_frames; t++)
                    mix.Slice(t).Row(c).CopyFromVec(cstft.Row(t));
            }
            bftk::Tensor<double> tf_mask(bftk::TensorDims{num_frames, num_bins});
            tf_mask.Slice(0).CopyFromMat(mask);

            bftk::CTensor<double> enhan;
            try {
                bftk::MaskBeamform(beamformer_opts, mix,
                                   mask_type == "target" ? &tf_mask : NULL,
                                   mask_type == "noise" ? &tf_mask : NULL, &enhan);
            } catch (const bftk::NumericalFailure &e) {
                KALDI_WARN << "Utterance " << utt_key << ": " << e.what() << ", skip";
                num_miss++;
                continue;
            }

            Matrix<double> enhan_rstft;
            bftk::CastIntoRealfft(enhan.Slice(0), &enhan_rstft);
            stft_writer.Write(utt_key, Matrix<BaseFloat>(enhan_rstft));
            num_done++;

            if (num_done % 100 == 0)
                KALDI_LOG << "Processed " << num_utts << " utterances.";
            KALDI_VLOG(2) << "Do " << beamformer_opts.beamformer
                          << " beamforming for utterance-id " << utt_key << " done.";
        }

        KALDI_LOG << "Done " << num_done << " utterances out of " << num_utts
                  << ", " << num_miss << " missing cause of some problems.";

        return num_done == 0 ? 1: 0;

    } catch(const std::exception& e) {
        std::cerr << e.what();
        return -1;
    }
    return 0;
}
